#pragma once

#include <string>

#include "btoon/backend/backend_selector.hpp"
#include "btoon/codec/codec_options.hpp"
#include "btoon/config/config.hpp"

namespace btoon {

// Codec configuration, loaded from the "codec" section
class CodecConfig
    : public config::ReloadableConfigurationProperties<CodecConfig> {
public:
    struct EncodeConfig {
        bool compress = false;
        std::string algorithm = "zlib";
        int level = 6;
        bool auto_tabular = true;
        codec::FloatFormat float_format = codec::FloatFormat::Float32;
        codec::IntegerFormat integer_format = codec::IntegerFormat::Int32;
        std::size_t max_depth = 0;
    };

    struct DecodeConfig {
        bool decompress = false;
        std::size_t max_depth = 0;
    };

    // Read once, when the backend is first chosen.
    struct BackendConfig {
        bool accelerated = true;
        std::string library = "btoon_msgpack_backend";
    };

    EncodeConfig encode;
    DecodeConfig decode;
    BackendConfig backend;

    void from_ptree(const boost::property_tree::ptree& pt) override;
    void validate() const override;
    std::string properties_name() const override { return "codec"; }

    codec::EncodeOptions encode_options() const;
    codec::DecodeOptions decode_options() const;
    backend::BackendSettings backend_settings() const;
};

}  // namespace btoon
