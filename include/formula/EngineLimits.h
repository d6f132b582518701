#ifndef FORMULA_ENGINE_LIMITS_H
#define FORMULA_ENGINE_LIMITS_H

class ConfigLoader;

namespace Formula {

/**
 * @brief Host-imposed resource bounds for parsing and evaluation.
 *
 * A value of 0 disables the corresponding bound.
 *
 *   [LIMITS]
 *   # characters of source text
 *   max_formula_length   = 10000
 *   # AST nodes per formula
 *   max_node_count       = 5000
 *   # AST height / parser nesting. Chained binary operators count too:
 *   # "1 + 2 + 3" is three levels deep.
 *   max_depth            = 256
 *   # evaluator recursion
 *   max_evaluation_depth = 256
 */
struct EngineLimits {
    int maxFormulaLength   = 10000;
    int maxNodeCount       = 5000;
    int maxDepth           = 256;
    int maxEvaluationDepth = 256;

    static EngineLimits unlimited();
    static EngineLimits fromConfig(const ConfigLoader &config);
};

} // namespace Formula

#endif // FORMULA_ENGINE_LIMITS_H
