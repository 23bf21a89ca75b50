#include "thermocast/utils/random_source.hpp"

namespace thermocast::utils {

std::shared_ptr<RandomSource> defaultRandomSource() {
	static const std::shared_ptr<RandomSource> source = [] {
		std::random_device device;
		const auto seed = (static_cast<std::uint64_t>(device()) << 32) | device();
		return std::make_shared<SeededRandomSource>(seed);
	}();
	return source;
}

} // namespace thermocast::utils
