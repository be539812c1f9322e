/**
 * @file DocumentRef.hpp
 * @brief Input records handed to the extraction pipeline.
 */

#pragma once
#include <map>
#include <string>

namespace docingest::domain {

/**
 * @struct DocumentRef
 * @brief Immutable reference to a local file awaiting extraction.
 */
struct DocumentRef {
    std::string localPath;        ///< File on disk to read.
    std::string declaredFormat;   ///< Format label supplied by the host, may be empty.
    std::string sourceNameOrURL;  ///< Basis for extension inference and output naming.
};

/**
 * @class ResourceRecord
 * @brief Typed view of a host document record, validated at the boundary.
 */
class ResourceRecord {
public:
    std::string id;                              ///< Document identifier.
    std::string parentId;                        ///< Owning collection (package) identifier.
    std::string formatTag;                       ///< Declared format label.
    std::string url;                             ///< Source URL, may be empty.
    std::string name;                            ///< Display name, used when url is empty.
    std::map<std::string, std::string> extras;   ///< Free-form host attributes.

    /** @brief URL when present, otherwise the display name. */
    const std::string& sourceNameOrURL() const {
        return url.empty() ? name : url;
    }

    /** @brief True when the record carries the fields the pipeline needs. */
    bool isValid() const {
        return !id.empty() && (!url.empty() || !name.empty());
    }
};

} // namespace docingest::domain
