/*
 * winpipe Directive Parser Interface
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Declares parse_directive, which consumes the arguments of one command from
 *   an ArgCursor. Commands are chained without separators: once a command has
 *   filled its positional slots, the next bare value is handed back in
 *   next_command instead of being consumed, and becomes the name of the
 *   following directive.
 *
 * License (MIT): (see full text in args.hpp header)
 */
#pragma once
#include <optional>
#include <string>
#include "winpipe/cli/args.hpp"
#include "winpipe/compile/directive.hpp"

namespace winpipe::compile {

struct ParsedDirective {
    Directive directive;
    std::optional<std::string> next_command;
};

// Throws ArgumentError for unknown commands and malformed arguments.
ParsedDirective parse_directive(const std::string& command, ArgCursor& args);

// Query directives leave a window set behind for the following steps.
bool is_query(const Directive& d);

} // namespace winpipe::compile
