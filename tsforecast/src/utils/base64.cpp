#include "tsforecast/utils/base64.hpp"

namespace tsforecast::utils {

std::string base64Encode(const std::vector<std::uint8_t> &data) {
	static constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
	std::string out;
	out.reserve(((data.size() + 2) / 3) * 4);

	std::size_t i = 0;
	for (; i + 2 < data.size(); i += 3) {
		const std::uint32_t n = (static_cast<std::uint32_t>(data[i]) << 16) |
		                        (static_cast<std::uint32_t>(data[i + 1]) << 8) | static_cast<std::uint32_t>(data[i + 2]);
		out.push_back(kAlphabet[(n >> 18) & 63]);
		out.push_back(kAlphabet[(n >> 12) & 63]);
		out.push_back(kAlphabet[(n >> 6) & 63]);
		out.push_back(kAlphabet[n & 63]);
	}

	const std::size_t remaining = data.size() - i;
	if (remaining == 0) {
		return out;
	}
	std::uint32_t n = static_cast<std::uint32_t>(data[i]) << 16;
	if (remaining == 2) {
		n |= static_cast<std::uint32_t>(data[i + 1]) << 8;
	}
	out.push_back(kAlphabet[(n >> 18) & 63]);
	out.push_back(kAlphabet[(n >> 12) & 63]);
	out.push_back(remaining == 2 ? kAlphabet[(n >> 6) & 63] : '=');
	out.push_back('=');
	return out;
}

} // namespace tsforecast::utils
