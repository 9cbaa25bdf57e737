#include "math_diagnostics.hpp"
#include "../../lib/log.h"
#include <cstdarg>
#include <cstdio>

namespace docx2tex {

void MathDiagnostics::report(const char* element, const char* format, ...) {
    char buf[512];
    va_list args;
    va_start(args, format);
    vsnprintf(buf, sizeof(buf), format, args);
    va_end(args);

    log_warn("math: formula %d: %s: %s", formula_index_, element ? element : "?", buf);
    items_.push_back(MathDiagnostic{formula_index_, element ? element : "", buf});
}

} // namespace docx2tex
