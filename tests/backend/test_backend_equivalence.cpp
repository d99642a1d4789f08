// tests/backend/test_backend_equivalence.cpp
#define BOOST_TEST_MODULE BackendEquivalenceTests
#include <boost/test/unit_test.hpp>
#include <limits>
#include <memory>
#include <string>
#include <vector>

#include "btoon/backend/accelerated_backend.hpp"
#include "btoon/backend/backend_selector.hpp"
#include "btoon/backend/codec_backend.hpp"
#include "btoon/backend/shared_library_service.hpp"
#include "btoon/codec/codec_error.hpp"

#ifndef BTOON_MSGPACK_BACKEND_PATH
#error "BTOON_MSGPACK_BACKEND_PATH must name the built service library"
#endif

using namespace btoon;
using codec::Value;

namespace {

using Bytes = std::vector<uint8_t>;

// Both backends, with the accelerated one loaded from the built library.
struct EquivalenceFixture {
    backend::ReferenceBackend reference;
    std::unique_ptr<backend::AcceleratedBackend> accelerated;

    EquivalenceFixture() {
        accelerated = std::make_unique<backend::AcceleratedBackend>(
            backend::load_shared_library_service(BTOON_MSGPACK_BACKEND_PATH));
    }
};

std::vector<Value> corpus() {
    std::vector<Value> values{
        Value(),
        Value(true),
        Value(false),
        Value(0),
        Value(127),
        Value(128),
        Value(-1),
        Value(-32),
        Value(-33),
        Value(std::numeric_limits<int32_t>::max()),
        Value(std::numeric_limits<int32_t>::min()),
        Value(int64_t{1} << 40),
        Value(std::numeric_limits<int64_t>::min()),
        Value(0.0),
        Value(-0.0),
        Value(1.5),
        Value(0.1),
        Value(1e300),
        Value(std::numeric_limits<double>::infinity()),
        Value(""),
        Value(std::string(31, 'a')),
        Value(std::string(32, 'b')),
        Value(std::string(255, 'c')),
        Value(std::string(256, 'd')),
        Value(std::string(65536, 'e')),
        Value("\xe6\x97\xa5\xe6\x9c\xac"),
        Value(Value::Bytes{}),
        Value(Value::Bytes(255, 0x01)),
        Value(Value::Bytes(256, 0x02)),
        Value(Value::Bytes(65535, 0x03)),
        Value(Value::List{}),
        Value(Value::List(15, Value(1))),
        Value(Value::List(16, Value("x"))),
        Value(Value::List(65536, Value())),
        Value(Value::Map{}),
    };

    Value::Map wide;
    for (int i = 0; i < 16; ++i) {
        wide.emplace_back("k" + std::to_string(i), i * 1000);
    }
    values.emplace_back(std::move(wide));

    Value::Map document;
    document.emplace_back("id", 9001);
    document.emplace_back("ratio", 0.75);
    document.emplace_back("pi", 3.141592653589793);
    document.emplace_back(7, Value::List{Value::Bytes{0xde, 0xad}, Value()});
    document.emplace_back(Value(), Value::Map{{Value("nested"), Value(true)}});
    values.emplace_back(std::move(document));

    Value deep(0);
    for (int i = 0; i < 64; ++i) {
        deep = Value(Value::List{std::move(deep), Value(i)});
    }
    values.push_back(std::move(deep));
    return values;
}

std::vector<codec::EncodeOptions> option_matrix() {
    std::vector<codec::EncodeOptions> matrix;
    for (auto float_format :
         {codec::FloatFormat::Float32, codec::FloatFormat::Float64,
          codec::FloatFormat::Adaptive}) {
        for (auto integer_format :
             {codec::IntegerFormat::Int32, codec::IntegerFormat::Int64}) {
            codec::EncodeOptions options;
            options.float_format = float_format;
            options.integer_format = integer_format;
            matrix.push_back(options);
        }
    }
    return matrix;
}

// Both calls must fail with the same error kind at the same offset.
template <typename ReferenceCall, typename AcceleratedCall>
void check_same_error(ReferenceCall reference_call,
                      AcceleratedCall accelerated_call) {
    codec::CodecError reference_code{};
    codec::CodecError accelerated_code{};
    std::size_t reference_offset = 0;
    std::size_t accelerated_offset = 0;

    try {
        reference_call();
        BOOST_ERROR("reference backend accepted the input");
    } catch (const codec::CodecException& e) {
        reference_code = e.code();
        reference_offset = e.offset();
    }
    try {
        accelerated_call();
        BOOST_ERROR("accelerated backend accepted the input");
    } catch (const codec::CodecException& e) {
        accelerated_code = e.code();
        accelerated_offset = e.offset();
    }

    BOOST_CHECK(reference_code == accelerated_code);
    BOOST_CHECK_EQUAL(reference_offset, accelerated_offset);
}

}  // namespace

BOOST_FIXTURE_TEST_SUITE(BackendEquivalenceSuite, EquivalenceFixture)

BOOST_AUTO_TEST_CASE(test_service_loaded) {
    BOOST_CHECK(accelerated->is_accelerated());
    BOOST_CHECK(accelerated->get_name().find("btoon_msgpack_backend") !=
                std::string::npos);
}

BOOST_AUTO_TEST_CASE(test_encode_is_byte_identical) {
    const auto values = corpus();
    for (const auto& options : option_matrix()) {
        for (const auto& value : values) {
            auto expected = reference.encode(value, options);
            auto actual = accelerated->encode(value, options);
            BOOST_CHECK_EQUAL_COLLECTIONS(actual.begin(), actual.end(),
                                          expected.begin(), expected.end());
        }
    }
}

BOOST_AUTO_TEST_CASE(test_decode_is_value_identical) {
    const auto values = corpus();
    for (const auto& options : option_matrix()) {
        for (const auto& value : values) {
            auto wire = reference.encode(value, options);
            BOOST_CHECK(accelerated->decode(wire, {}) ==
                        reference.decode(wire, {}));
        }
    }
}

BOOST_AUTO_TEST_CASE(test_decode_ignores_trailing_bytes) {
    Bytes wire{0x91, 0x05, 0xc1, 0xff};
    BOOST_CHECK(accelerated->decode(wire, {}) == reference.decode(wire, {}));
}

BOOST_AUTO_TEST_CASE(test_decode_errors_match) {
    const std::vector<Bytes> malformed{
        {},
        {0xc1},
        {0xc6, 0x00, 0x00, 0x00, 0x01, 0x7f},
        {0x92, 0x01, 0xc6, 0x00, 0x00, 0x00, 0x00},
        {0xcc, 0x01},
        {0xd4, 0x01, 0x02},
        {0x93, 0x01, 0x02, 0xc7, 0x00, 0x00},
        {0xca, 0x00},
        {0xd3, 0x00, 0x00, 0x00},
        {0xa4, 'a', 'b'},
        {0xc5, 0x00},
        {0xdc, 0x00, 0x03, 0x01},
        {0x82, 0xa1, 'k'},
        {0xdd, 0xff, 0xff, 0xff, 0xff},
    };
    for (const auto& wire : malformed) {
        check_same_error([&] { reference.decode(wire, {}); },
                         [&] { accelerated->decode(wire, {}); });
    }
}

BOOST_AUTO_TEST_CASE(test_depth_limits_match) {
    Bytes wire{0x91, 0x91, 0x91, 0xc0};
    codec::DecodeOptions decode_options;
    decode_options.max_depth = 2;
    check_same_error([&] { reference.decode(wire, decode_options); },
                     [&] { accelerated->decode(wire, decode_options); });

    Bytes map_wire{0x81, 0xa1, 'k', 0xde, 0x00, 0x01, 0x90, 0x90};
    check_same_error([&] { reference.decode(map_wire, decode_options); },
                     [&] { accelerated->decode(map_wire, decode_options); });

    codec::EncodeOptions encode_options;
    encode_options.max_depth = 2;
    Value nested(Value::List{Value(Value::List{Value(Value::List{})})});
    BOOST_CHECK_THROW(reference.encode(nested, encode_options),
                      codec::UnsupportedValueException);
    BOOST_CHECK_THROW(accelerated->encode(nested, encode_options),
                      codec::UnsupportedValueException);
}

BOOST_AUTO_TEST_CASE(test_deep_nesting_fails_identically) {
    Bytes wire(100000, 0x91);
    wire.push_back(0xc0);
    codec::DecodeOptions options;
    options.max_depth = 64;
    check_same_error([&] { reference.decode(wire, options); },
                     [&] { accelerated->decode(wire, options); });
}

BOOST_AUTO_TEST_CASE(test_bytes_beyond_16_bit_length_rejected_by_both) {
    Value large(Value::Bytes(65536, 0x04));
    BOOST_CHECK_THROW(reference.encode(large, {}),
                      codec::UnsupportedValueException);
    BOOST_CHECK_THROW(accelerated->encode(large, {}),
                      codec::UnsupportedValueException);
}

BOOST_AUTO_TEST_CASE(test_nested_lists_within_limit_match) {
    Bytes wire(2000, 0x91);
    wire.push_back(0x2a);
    codec::DecodeOptions options;
    options.max_depth = 4096;
    BOOST_CHECK(accelerated->decode(wire, options) ==
                reference.decode(wire, options));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ServiceLoadingSuite)

BOOST_AUTO_TEST_CASE(test_missing_library) {
    BOOST_CHECK_THROW(
        backend::SharedLibraryService("/nonexistent/libbtoon_missing.so"),
        codec::BackendUnavailableException);
}

BOOST_AUTO_TEST_CASE(test_selector_loads_library_by_path) {
    backend::BackendSelector selector(
        [](const backend::BackendSettings& settings) {
            return backend::load_shared_library_service(settings.library);
        });
    backend::BackendSettings settings;
    settings.library = BTOON_MSGPACK_BACKEND_PATH;
    BOOST_CHECK(selector.configure(settings));
    BOOST_CHECK(selector.accelerated());
}

BOOST_AUTO_TEST_CASE(test_selector_falls_back_on_missing_library) {
    backend::BackendSelector selector(
        [](const backend::BackendSettings& settings) {
            return backend::load_shared_library_service(settings.library);
        });
    backend::BackendSettings settings;
    settings.library = "btoon_no_such_backend";
    selector.configure(settings);
    BOOST_CHECK(!selector.accelerated());
    BOOST_CHECK_EQUAL(selector.backend().get_name(), "reference");
}

BOOST_AUTO_TEST_SUITE_END()
