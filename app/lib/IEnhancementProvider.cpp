#include "IEnhancementProvider.hpp"
#include "EnhancementErrors.hpp"


std::string IEnhancementProvider::analyze_image(const std::vector<unsigned char>&,
                                                const std::string&,
                                                const std::string&,
                                                const std::string&,
                                                const std::string&,
                                                const ProgressCallback&)
{
    throw ProviderError::capability_unsupported(kind());
}
