#include "btoon/codec_config.hpp"

#include <stdexcept>

namespace btoon {

void CodecConfig::from_ptree(const boost::property_tree::ptree& pt) {
    if (auto encode_pt = pt.get_child_optional("encode")) {
        encode.compress = get_value(*encode_pt, "compress", encode.compress);
        encode.algorithm =
            get_value(*encode_pt, "algorithm", encode.algorithm);
        encode.level = get_value(*encode_pt, "level", encode.level);
        encode.auto_tabular =
            get_value(*encode_pt, "auto_tabular", encode.auto_tabular);
        if (auto format =
                get_optional_value<std::string>(*encode_pt, "float_format")) {
            encode.float_format = codec::float_format_from_string(*format);
        }
        if (auto format = get_optional_value<std::string>(*encode_pt,
                                                          "integer_format")) {
            encode.integer_format = codec::integer_format_from_string(*format);
        }
        encode.max_depth =
            get_value(*encode_pt, "max_depth", encode.max_depth);
    }

    if (auto decode_pt = pt.get_child_optional("decode")) {
        decode.decompress =
            get_value(*decode_pt, "decompress", decode.decompress);
        decode.max_depth =
            get_value(*decode_pt, "max_depth", decode.max_depth);
    }

    if (auto backend_pt = pt.get_child_optional("backend")) {
        backend.accelerated =
            get_value(*backend_pt, "accelerated", backend.accelerated);
        backend.library = get_value(*backend_pt, "library", backend.library);
    }
}

void CodecConfig::validate() const {
    if (encode.algorithm != "zlib" && encode.algorithm != "gzip" &&
        encode.algorithm != "none") {
        throw std::invalid_argument(
            "Codec compression algorithm must be 'zlib', 'gzip' or 'none'");
    }

    if (encode.level < 0 || encode.level > 9) {
        throw std::invalid_argument(
            "Codec compression level must be between 0 and 9");
    }

    if (backend.accelerated && backend.library.empty()) {
        throw std::invalid_argument(
            "Codec backend library cannot be empty when the accelerated "
            "backend is enabled");
    }
}

codec::EncodeOptions CodecConfig::encode_options() const {
    codec::EncodeOptions options;
    options.compress = encode.compress;
    options.algorithm = encode.algorithm;
    options.level = encode.level;
    options.auto_tabular = encode.auto_tabular;
    options.float_format = encode.float_format;
    options.integer_format = encode.integer_format;
    options.max_depth = encode.max_depth;
    return options;
}

codec::DecodeOptions CodecConfig::decode_options() const {
    codec::DecodeOptions options;
    options.decompress = decode.decompress;
    options.max_depth = decode.max_depth;
    return options;
}

backend::BackendSettings CodecConfig::backend_settings() const {
    return backend::BackendSettings{backend.accelerated, backend.library};
}

}  // namespace btoon
