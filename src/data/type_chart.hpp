#ifndef EVSIM_DATA_TYPE_CHART_HPP
#define EVSIM_DATA_TYPE_CHART_HPP

#include <string>
#include <vector>

namespace evsim::data {

/// Effectiveness of one attacking type against one defending type (0, 0.5, 1, 2).
double type_effectiveness(const std::string& attacking, const std::string& defending);

/// Product over all defending types. Unknown type names are neutral.
double type_effectiveness(const std::string& attacking,
                          const std::vector<std::string>& defending);

bool is_known_type(const std::string& type);

} // namespace evsim::data

#endif // EVSIM_DATA_TYPE_CHART_HPP
