#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(ilCore, "incidentlens.core")
Q_LOGGING_CATEGORY(ilIngest, "incidentlens.ingest")
Q_LOGGING_CATEGORY(ilRelevance, "incidentlens.relevance")
Q_LOGGING_CATEGORY(ilAnalytics, "incidentlens.analytics")
Q_LOGGING_CATEGORY(ilPipeline, "incidentlens.pipeline")
