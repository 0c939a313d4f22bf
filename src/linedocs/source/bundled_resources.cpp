#include <linedocs/source/bundled_resources.h>

#include <utility>

namespace linedocs {

void BundledResources::add(const std::string &identifier, std::string bytes) {
    blobs_[identifier] = std::move(bytes);
}

const std::string *BundledResources::find(const std::string &identifier) const {
    auto it = blobs_.find(identifier);
    if (it == blobs_.end()) {
        return nullptr;
    }
    return &it->second;
}

bool BundledResources::contains(const std::string &identifier) const {
    return blobs_.find(identifier) != blobs_.end();
}

}  // namespace linedocs
