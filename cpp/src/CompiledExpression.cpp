#include "CompiledExpression.h"
#include <algorithm>
#include <exprtk.hpp>

#include "Errors.h"
#include "InputData.h"

using namespace ipsim;


struct CompiledExpression::Impl {
    exprtk::symbol_table<double> symbols;
    exprtk::expression<double> expression;
    exprtk::parser<double> parser;

    // Bound by reference into the symbol table; never resized after construction.
    std::vector<double> values;

    Impl(const std::string& expr, const std::vector<std::string>& names) : values(names.size(), 0.0) {
        for (size_t i = 0; i < names.size(); ++i)
            if (!symbols.add_variable(names[i], values[i]))
                throw ConfigurationError("CompiledExpression: '" + names[i] +
                                         "' cannot be used as a variable name");
        symbols.add_constants(); // math constants (pi, e, etc.)
        expression.register_symbol_table(symbols);

        if (!parser.compile(expr, expression))
            throw ConfigurationError("CompiledExpression: cannot compile '" + expr + "': " + parser.error());
    }
};

CompiledExpression::CompiledExpression(const std::string& expr, const VariableLayout& layout):
    expr_(expr), names_(layout.names()), impl_(std::make_unique<Impl>(expr_, names_)) {}

CompiledExpression::CompiledExpression(const CompiledExpression& other):
    expr_(other.expr_), names_(other.names_), impl_(std::make_unique<Impl>(expr_, names_)) {}

CompiledExpression& CompiledExpression::operator=(const CompiledExpression& other) {
    if (this != &other) {
        expr_ = other.expr_;
        names_ = other.names_;
        impl_ = std::make_unique<Impl>(expr_, names_);
    }
    return *this;
}

CompiledExpression::CompiledExpression(CompiledExpression&& other) noexcept = default;
CompiledExpression& CompiledExpression::operator=(CompiledExpression&& other) noexcept = default;
CompiledExpression::~CompiledExpression() = default;


double CompiledExpression::eval(const std::vector<double>& scope) const {
    auto& impl = *impl_;
    std::copy(scope.begin(), scope.begin() + std::min(scope.size(), impl.values.size()), impl.values.begin());
    return impl.expression.value();
}
