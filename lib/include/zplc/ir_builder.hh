//
// IR Builder API
//
// Converts parsed commands into drawing instructions
//

#pragma once

#include "ast.hh"
#include "ir.hh"

namespace zplc::ir {

/// Run the modal state machine over the commands. Never throws on content:
/// a ^GF with a compression scheme other than A stops processing and leaves a
/// warning in the diagnostics.
build_result build_instructions(const ast::command_list& commands);

} // namespace zplc::ir
