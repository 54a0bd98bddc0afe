#ifndef LANSHARE_METADATA_SINK_HPP
#define LANSHARE_METADATA_SINK_HPP

#include <filesystem>
#include <string>

#include "../dht/kademlia.hpp"
#include "../files/manifest.hpp"

/**
 * @brief Write-only notifications about peers, shares and downloads.
 * The core never reads them back to make decisions.
 */
class MetadataSink {
public:
    virtual ~MetadataSink() = default;

    virtual void record_peer(const dht::Contact& contact) = 0;
    virtual void record_shared_file(const Manifest& manifest, const std::filesystem::path& source_path) = 0;
    virtual void record_download(const std::string& info_hash_hex, const std::string& file_name,
                                 const std::string& status, const std::string& output_path) = 0;
};

#endif //LANSHARE_METADATA_SINK_HPP
