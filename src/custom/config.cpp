#include "config.hpp"

#include <cz/defer.hpp>
#include <cz/format.hpp>
#include <tracy/Tracy.hpp>
#include "core/buffer.hpp"
#include "core/configuration.hpp"
#include "core/file.hpp"

namespace braid {
namespace custom {

/// Org source block markers.  Org allows them to be indented.
#define ORG_EMACS_LISP_START "^[ \\t]*#\\+BEGIN_SRC emacs-lisp"
#define ORG_CLOJURE_START "^[ \\t]*#\\+BEGIN_SRC clojure"
#define ORG_END "^[ \\t]*#\\+END_SRC"

static const Line_Rule orgel_to_source[] = {
    // `# # ` is as wide as `;;; ` and can't be confused with an ordinary org comment.
    {Line_Rule::FIRST_LINE, "^;; # # ", ";;; "},
    {Line_Rule::EVERY_LINE, "^;; \\* (\\w+)$", ";;; $1:"},
};

static const Line_Rule orgel_to_document[] = {
    {Line_Rule::FIRST_LINE, "^;;; ", ";; # # "},
    {Line_Rule::EVERY_LINE, "^;;; (\\w+):$", ";; * $1"},
};

const Overlay orgel_overlay = {
    {orgel_to_source, sizeof(orgel_to_source) / sizeof(*orgel_to_source)},
    {orgel_to_document, sizeof(orgel_to_document) / sizeof(*orgel_to_document)},
};

const Named_Configuration named_configurations[] = {
    {"org-el", ".el", UNCOMMENTED_BLOCK, ";; ", ORG_EMACS_LISP_START, ORG_END, false, {}},
    {"el-org", ".org", COMMENTED_BLOCK, ";; ", ORG_EMACS_LISP_START, ORG_END, false, {}},
    {"org-orgel", ".el", UNCOMMENTED_BLOCK, ";; ", ORG_EMACS_LISP_START, ORG_END, false,
     orgel_overlay},
    {"orgel-org", ".org", COMMENTED_BLOCK, ";; ", ORG_EMACS_LISP_START, ORG_END, false,
     orgel_overlay},

    // Clojure sources often contain `#+begin_src clojure` in strings
    // when they generate documentation so only match upper case markers.
    {"org-clojure", ".clj", UNCOMMENTED_BLOCK, ";; ", ORG_CLOJURE_START, ORG_END, true, {}},
};
const size_t named_configurations_len =
    sizeof(named_configurations) / sizeof(*named_configurations);

const Named_Configuration* find_named_configuration(cz::Str name) {
    for (size_t i = 0; i < named_configurations_len; ++i) {
        if (named_configurations[i].name == name) {
            return &named_configurations[i];
        }
    }
    return nullptr;
}

bool init_named_configuration(const Named_Configuration& named,
                              cz::Str this_name,
                              cz::Str that_name,
                              Configuration* config,
                              cz::Heap_String* error) {
    ZoneScoped;

    Configuration_Options options = {};
    options.name = named.name;
    options.this_name = this_name;
    options.that_name = that_name;
    options.strategy = named.strategy;
    options.comment = named.comment;
    options.region_start = named.region_start;
    options.region_end = named.region_end;
    options.case_sensitive = named.case_sensitive;
    options.overlay = named.overlay;
    return make_configuration(options, config, error);
}

bool init_named_configuration(cz::Str name,
                              const Buffer& this_buffer,
                              Configuration* config,
                              cz::Heap_String* error) {
    const Named_Configuration* named = find_named_configuration(name);
    if (!named) {
        cz::Heap_String message = cz::format("No configuration named ", name);
        CZ_DEFER(message.drop());
        assign_string(error, message);
        return false;
    }

    cz::Heap_String that_path = {};
    CZ_DEFER(that_path.drop());
    if (!swap_extension(this_buffer.path, named->target_extension, &that_path)) {
        cz::Heap_String message = cz::format("Configuration ", name, ": buffer ",
                                             this_buffer.name, " isn't backed by a file");
        CZ_DEFER(message.drop());
        assign_string(error, message);
        return false;
    }

    return init_named_configuration(*named, this_buffer.name, that_path, config, error);
}

}
}
