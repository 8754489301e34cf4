#pragma once

#include <cz/heap_string.hpp>
#include <cz/str.hpp>
#include "core/block.hpp"
#include "core/overlay.hpp"

namespace braid {

struct Buffer;
struct Configuration;

namespace custom {

/// A configuration that can be instantiated by name for any pair of buffers.
struct Named_Configuration {
    cz::Str name;

    /// The extension of the `that` buffer, used when deriving its path from `this`.
    cz::Str target_extension;

    Block_Strategy strategy;
    cz::Str comment;
    cz::Str region_start;
    cz::Str region_end;
    bool case_sensitive;
    Overlay overlay;
};

/// All configurations in lookup order.
extern const Named_Configuration named_configurations[];
extern const size_t named_configurations_len;

/// The rules converting between org headings and the `;;; Section:` convention of Emacs Lisp
/// files (the "orgel" form).  `# # summary` on the first line of the document becomes the
/// `;;; summary` line and `* Heading` becomes `;;; Heading:`.
extern const Overlay orgel_overlay;

/// Look up a configuration by name.  Returns `nullptr` if there is none.
const Named_Configuration* find_named_configuration(cz::Str name);

/// Instantiate `named` linking `this_name` to the explicitly supplied `that_name`.
bool init_named_configuration(const Named_Configuration& named,
                              cz::Str this_name,
                              cz::Str that_name,
                              Configuration* config,
                              cz::Heap_String* error);

/// Instantiate the configuration called `name` for `this_buffer`.  The target is
/// derived from the buffer's path by swapping in the configuration's extension.
bool init_named_configuration(cz::Str name,
                              const Buffer& this_buffer,
                              Configuration* config,
                              cz::Heap_String* error);

}
}
