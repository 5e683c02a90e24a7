#ifndef DISPATCHKIT_COMMON_UTILS_TEMPLATE_RENDERER_H
#define DISPATCHKIT_COMMON_UTILS_TEMPLATE_RENDERER_H

#include "dispatchkit/common/types.h"
#include <inja/inja.hpp>
#include <string>
#include <string_view>

namespace dispatchkit {

// Evaluates the inja expressions of model files (`expression:` functions and
// `input_domain:` predicates). Templates cannot include other files.
class ExpressionRenderer {
public:
    ExpressionRenderer();

    // Render errors are rethrown as std::runtime_error
    std::string render(std::string_view expression, const Context& scope);

    // JSON when the trimmed text parses as JSON, else the text itself
    Value render_value(std::string_view expression, const Context& scope);

    bool evaluate_condition(std::string_view expression, const Context& scope);

    // 每个线程一个实例, 并发 dispatch 不共享 inja 环境
    static ExpressionRenderer& thread_instance();

private:
    inja::Environment env_;
};

} // namespace dispatchkit

#endif // DISPATCHKIT_COMMON_UTILS_TEMPLATE_RENDERER_H
