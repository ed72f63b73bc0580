#pragma once
#include <string>
#include <vector>
#include <algorithm>

namespace ramancal {

/*  Degraded-but-usable outcomes.  Fatal conditions are exceptions
 *  (see Errors.hpp), everything listed here travels with the result.     */
enum class DiagnosticCode {
    InsufficientPeaksFound,     // fewer maxima than requested at prominence 0
    PeakSearchNotConverged,     // iteration cap hit while still above target
    PeakSearchOvershot,         // one increment skipped past the target
    RefinementOutOfBounds       // sub-pixel fit fell back to integer index
};

struct Diagnostic {
    DiagnosticCode code;
    std::string    message;
};

using Diagnostics = std::vector<Diagnostic>;

const char* to_string(DiagnosticCode code);

inline bool has_diagnostic(const Diagnostics& diags, DiagnosticCode code)
{
    return std::any_of(diags.begin(), diags.end(),
                       [code](const Diagnostic& d) { return d.code == code; });
}

/* append `more` to `into` (keeps order) */
inline void append_diagnostics(Diagnostics& into, const Diagnostics& more)
{
    into.insert(into.end(), more.begin(), more.end());
}

/* record a diagnostic and echo it to std::cerr as "[tag] Warning: …" */
void warn(Diagnostics&       diags,
          DiagnosticCode     code,
          const std::string& tag,
          const std::string& message);

} // namespace ramancal
