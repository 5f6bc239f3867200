/*
 * winpipe Pipeline Compiler Interface
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Compiles a chain of directives into one KWin script: header, one fragment
 *   per directive in argument order, a trailing fragment that reports the
 *   window stack when the last directive is a query, and the footer. Errors
 *   raised while compiling a directive carry an "in command '<name>'" context.
 *
 * License (MIT): (see full text in args.hpp header)
 */
#pragma once
#include <optional>
#include <string>
#include <vector>
#include "winpipe/cli/args.hpp"
#include "winpipe/compile/directive_parser.hpp"
#include "winpipe/render/bindings.hpp"

namespace winpipe::compile {

struct Step {
    std::string script;
    bool is_query = false;
    std::optional<std::string> next_command;
};

struct CompiledScript {
    std::string text;
    std::vector<Step> steps;
    bool emits_last_result = false;
};

// base carries the session bindings; step_name and the directive's own keys are layered on top.
Step render_step(const std::string& command, const ParsedDirective& parsed, const render::Bindings& base);

CompiledScript compile_script(const render::Bindings& base, ArgCursor& args, const std::string& first_command);

} // namespace winpipe::compile
