#pragma once

#include <string>

#include <nlohmann/json_fwd.hpp>

#include "tfharvest/volume.hpp"

namespace tfharvest
{

class VolumeDecoder
{
  public:
    virtual ~VolumeDecoder() = default;

    // Called concurrently from every worker.
    virtual bool decode(const std::string &path, Volume &out, std::string &err) const = 0;
};

struct FeatureDecodeOptions
{
    bool include_header_footer = false;
};

// Extracted-features volumes: plain .json, .json.gz or .json.xz.
class FeatureFileDecoder final : public VolumeDecoder
{
  public:
    explicit FeatureFileDecoder(FeatureDecodeOptions options = {});

    bool decode(const std::string &path, Volume &out, std::string &err) const override;

    bool decode_document(const nlohmann::json &doc, Volume &out, std::string &err) const;

  private:
    FeatureDecodeOptions options_;
};

bool read_file_all(const std::string &path, std::string &out, std::string &err);

} // namespace tfharvest
