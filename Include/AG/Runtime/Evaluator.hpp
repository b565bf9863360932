#pragma once

#include "AG/AST.hpp"
#include "AG/Runtime/Activation.hpp"
#include "AG/Runtime/FunctionRegistry.hpp"

#include <optional>
#include <vector>

namespace ag {
    namespace eval {
        /**
         * @brief Evaluate an expression under a binding
         * @return The value, or std::nullopt when evaluation fails (unbound
         *         variable, type mismatch, division by zero, unknown function,
         *         function rejecting its arguments)
         */
        std::optional<Value> evaluate(const Expr& expr,
                                      const Binding& binding,
                                      const FunctionRegistry& functions);

        /**
         * @brief Evaluate a test guard
         * @return true only if the expression evaluates to boolean true
         */
        bool evaluateTest(const Expr& expr,
                          const Binding& binding,
                          const FunctionRegistry& functions);

        // Every ?variable referenced by the expression, in source order
        void collectVariables(const Expr& expr, std::vector<Variable>& out);

        // Every function call in the expression, outermost first
        void collectCalls(const Expr& expr, std::vector<const ExprCall*>& out);
    } // namespace eval
} // namespace ag
