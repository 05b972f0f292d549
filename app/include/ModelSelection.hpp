#ifndef MODEL_SELECTION_HPP
#define MODEL_SELECTION_HPP

#include "Types.hpp"

#include <string>
#include <vector>

namespace ModelSelection {

std::string flagship_text_model(ProviderKind kind);
std::string flagship_image_model(ProviderKind kind);

const std::vector<std::string>& vision_keywords();
bool is_vision_model(const RemoteAIModel& model);

/**
 * @brief Keeps entries whose id or display name contains a vision keyword
 * (case-insensitive). Catalog order is preserved.
 */
std::vector<RemoteAIModel> filter_vision_models(const std::vector<RemoteAIModel>& catalog);

/**
 * @brief Returns @p current when it is in @p catalog, else @p flagship when
 * present, else the first entry. An empty catalog leaves @p current untouched.
 */
std::string reconcile_selection(const std::string& current,
                                const std::vector<RemoteAIModel>& catalog,
                                const std::string& flagship);

} // namespace ModelSelection

#endif // MODEL_SELECTION_HPP
