#include "protocol/encoding.hpp"

#include <boost/algorithm/hex.hpp>
#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/dataflow_exception.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <iterator>

namespace BuildCacheS3::Protocol
{

namespace
{

using Base64Encoder = boost::archive::iterators::base64_from_binary<
    boost::archive::iterators::transform_width<std::string_view::const_iterator, 6, 8>>;

using Base64Decoder = boost::archive::iterators::transform_width<
    boost::archive::iterators::binary_from_base64<std::string::const_iterator>, 8, 6>;

std::error_code ProtocolError()
{
    return Storage::make_error_code(Storage::StorageErrc::ProtocolError);
}

}  // namespace

std::string EncodeBase64(std::string_view bytes)
{
    std::string encoded(Base64Encoder(bytes.begin()), Base64Encoder(bytes.end()));
    encoded.append((3 - bytes.size() % 3) % 3, '=');
    return encoded;
}

StorageResult<std::string> DecodeBase64(std::string_view text)
{
    if (text.empty()) {
        return std::string{};
    }
    if (text.size() % 4 != 0) {
        spdlog::debug("base64: length {} is not a multiple of 4", text.size());
        return std::unexpected(ProtocolError());
    }

    const std::size_t first_pad = text.find('=');
    const std::size_t padding   = first_pad == std::string_view::npos ? 0 : text.size() - first_pad;
    if (padding > 2 ||
        (padding > 0 && text.find_first_not_of('=', first_pad) != std::string_view::npos)) {
        spdlog::debug("base64: malformed padding");
        return std::unexpected(ProtocolError());
    }

    // The decoder has no notion of padding; zero bits decode to nothing once trimmed.
    std::string input(text);
    std::fill(input.end() - static_cast<std::ptrdiff_t>(padding), input.end(), 'A');

    std::string decoded;
    try {
        decoded.assign(Base64Decoder(input.cbegin()), Base64Decoder(input.cend()));
    } catch (const boost::archive::iterators::dataflow_exception &e) {
        spdlog::debug("base64: {}", e.what());
        return std::unexpected(ProtocolError());
    }
    decoded.resize(decoded.size() - padding);
    return decoded;
}

std::string ToHex(std::string_view bytes)
{
    std::string hex;
    hex.reserve(bytes.size() * 2);
    boost::algorithm::hex_lower(bytes.begin(), bytes.end(), std::back_inserter(hex));
    return hex;
}

StorageResult<std::string> FromHex(std::string_view hex)
{
    std::string bytes;
    try {
        boost::algorithm::unhex(hex.begin(), hex.end(), std::back_inserter(bytes));
    } catch (const boost::algorithm::hex_decode_error &) {
        return std::unexpected(ProtocolError());
    }
    return bytes;
}

}  // namespace BuildCacheS3::Protocol
