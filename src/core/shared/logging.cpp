#include "core/shared/logging.h"

// Debug output is off by default; enable per area with QT_LOGGING_RULES,
// e.g. "ild.extraction.debug=true".
Q_LOGGING_CATEGORY(ildCore, "ild.core", QtInfoMsg)
Q_LOGGING_CATEGORY(ildIndex, "ild.index", QtInfoMsg)
Q_LOGGING_CATEGORY(ildExtraction, "ild.extraction", QtInfoMsg)
Q_LOGGING_CATEGORY(ildRetrieval, "ild.retrieval", QtInfoMsg)
