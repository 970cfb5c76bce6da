#ifndef PASTICHE_REPORT_HPP
#define PASTICHE_REPORT_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include "details/reporter.hpp"

namespace Pastiche::Report {
    using ReportOptions = Details::ReportOptions;
    using MetricsReporter = Details::MetricsReporter;

    using Details::sanitize_tag;

    [[nodiscard]] inline auto Reporter(const ReportOptions& options) -> MetricsReporter {
        return MetricsReporter(options);
    }
}

#endif // PASTICHE_REPORT_HPP
