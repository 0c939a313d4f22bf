#ifndef LINEDOCS_SOURCE_BUNDLED_RESOURCES_H
#define LINEDOCS_SOURCE_BUNDLED_RESOURCES_H

#include <cstddef>
#include <string>
#include <unordered_map>

namespace linedocs {

/**
 * Registry of corpora shipped inside the host (embedded blobs), keyed by
 * identifier. Populate it before handing it to a reader; lookups are
 * read-only and safe from several threads.
 *
 * Example usage:
 * ```cpp
 * auto resources = std::make_shared<linedocs::BundledResources>();
 * resources->add("europarl.lines.txt.gz", load_embedded_blob());
 * options.resources = resources;
 * ```
 */
class BundledResources {
   public:
    void add(const std::string &identifier, std::string bytes);

    /**
     * @return the registered bytes, nullptr if identifier is unknown
     */
    const std::string *find(const std::string &identifier) const;

    bool contains(const std::string &identifier) const;
    std::size_t size() const { return blobs_.size(); }

   private:
    std::unordered_map<std::string, std::string> blobs_;
};

}  // namespace linedocs

#endif  // LINEDOCS_SOURCE_BUNDLED_RESOURCES_H
