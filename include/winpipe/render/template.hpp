/*
 * winpipe Template Renderer
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Renders a named script fragment against a Bindings record. Supported tags:
 *     {{name}} {{{name}}}         value inserted verbatim
 *     {{js name}}                 value as a quoted script string literal
 *     {{#if name}} .. {{else}} .. {{/if}}   conditional, may nest
 *   Rendering is strict: a tag that is evaluated and names an unbound key raises
 *   RenderError, as does a malformed template. Tags inside a branch that is not
 *   taken are parsed but never looked up.
 *
 * License (MIT):
 *   Permission is hereby granted, free of charge, to any person obtaining a copy of this
 *   software and associated documentation files (the "Software"), to deal in the Software
 *   without restriction, including without limitation the rights to use, copy, modify, merge,
 *   publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons
 *   to whom the Software is furnished to do so, subject to the following conditions:
 *
 *   The above copyright notice and this permission notice shall be included in all copies or
 *   substantial portions of the Software.
 *
 *   THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED,
 *   INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR
 *   PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE
 *   FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR
 *   OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER
 *   DEALINGS IN THE SOFTWARE.
 */
#pragma once
#include <string>
#include "winpipe/render/bindings.hpp"

namespace winpipe::render {

struct Template {
    const char* name; // used in error messages
    const char* text;
};

std::string render(const Template& tpl, const Bindings& bindings);

// Double-quoted string literal, safe to embed in generated script text.
std::string js_quote(const std::string& in);

} // namespace winpipe::render
