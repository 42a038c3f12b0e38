#include "weekgrid/core/Logging.hpp"

namespace weekgrid {

Q_LOGGING_CATEGORY(lcCore, "weekgrid.core")
Q_LOGGING_CATEGORY(lcLayout, "weekgrid.layout")
Q_LOGGING_CATEGORY(lcData, "weekgrid.data")
Q_LOGGING_CATEGORY(lcUi, "weekgrid.ui")

} // namespace weekgrid
