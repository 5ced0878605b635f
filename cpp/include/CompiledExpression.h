#pragma once
/**
 * @file CompiledExpression.h
 * @brief An arithmetic expression evaluator over a replicate's variables.
 */
#include <memory>
#include <string>
#include <vector>

namespace ipsim {
    class VariableLayout;

    /**
     * @brief Holds a compiled expression for fast repeated evaluation.
     *
     * Evaluation writes into private variable storage, so one instance must not be
     * evaluated from two threads at once. Copies recompile and share nothing.
     */
    class CompiledExpression {
    public:
        /**
         * @brief Compile a new expression from source.
         * @param expr    arithmetic (and/or boolean) expression
         * @param layout  variables the expression may reference
         * @throws ConfigurationError on a syntax error or an unknown variable
         */
        CompiledExpression(const std::string& expr, const VariableLayout& layout);

        CompiledExpression(const CompiledExpression& other);
        CompiledExpression& operator=(const CompiledExpression& other);
        CompiledExpression(CompiledExpression&& other) noexcept;
        CompiledExpression& operator=(CompiledExpression&& other) noexcept;
        ~CompiledExpression();

        /**
         * @brief Evaluate on one replicate's scope.
         * @param scope  values in VariableLayout::names() order
         * @return   the result as double (0=false, nonzero=true)
         */
        double eval(const std::vector<double>& scope) const;

        /** @brief Get the original source string. */
        const std::string& expr() const { return expr_; }

    private:
        std::string expr_;
        std::vector<std::string> names_;
        struct Impl;
        std::unique_ptr<Impl> impl_;
    };
}
