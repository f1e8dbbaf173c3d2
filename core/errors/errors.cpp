#include "errors/errors.hpp"

namespace specsel {

std::string ErrorContext::describe() const {
    if (!inRun()) return "";
    return "iteration=" + std::to_string(iteration) +
           " labeled=" + std::to_string(labeled) +
           " pool=" + std::to_string(pool) +
           " validation=" + std::to_string(validation);
}

static std::string formatWhat(const std::string& kind,
                              const std::string& message,
                              const ErrorContext& context) {
    std::string what = kind + ": " + message;
    if (context.inRun()) {
        what += " [" + context.describe() + "]";
    }
    return what;
}

Error::Error(const std::string& kind, const std::string& message,
             ErrorContext context)
    : std::runtime_error(formatWhat(kind, message, context)),
      kind_(kind), detail_(message), context_(context) {}

} // namespace specsel
