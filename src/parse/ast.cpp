/*
 * HTTPScript AST helpers
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: See header for details.
 */
#include <httpscript/parse/ast.hpp>

namespace httpscript {

Value Value::literal(std::string text, Selection selection) {
    return Value{WithoutInline{std::move(text), std::move(selection)}};
}

const std::string& Value::text() const {
    return std::visit([](const auto& s) -> const std::string& { return s.value; }, state);
}

const Selection& Value::selection() const {
    return std::visit([](const auto& s) -> const Selection& { return s.selection; }, state);
}

const std::vector<InlineScript>& Value::inline_scripts() const {
    static const std::vector<InlineScript> empty;
    if (auto w = std::get_if<WithInline>(&state)) return w->inline_scripts;
    return empty;
}

} // namespace httpscript
