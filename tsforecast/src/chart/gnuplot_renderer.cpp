#include "tsforecast/chart/gnuplot_renderer.hpp"

#include "tsforecast/core/calendar.hpp"
#include "tsforecast/utils/logging.hpp"

#include <atomic>
#include <cstdlib>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <spawn.h>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace tsforecast::chart {

namespace {

namespace fs = std::filesystem;

constexpr const char *kDataTimeFormat = "%Y-%m-%dT%H:%M:%S";

std::string findExecutable(const std::string &command) {
	if (command.empty()) {
		return {};
	}
	if (command.find('/') != std::string::npos) {
		return ::access(command.c_str(), X_OK) == 0 ? command : std::string{};
	}
	const char *path_env = std::getenv("PATH");
	if (!path_env) {
		return {};
	}
	std::stringstream ss{std::string(path_env)};
	std::string token;
	while (std::getline(ss, token, ':')) {
		if (token.empty()) {
			token = ".";
		}
		const fs::path candidate = fs::path(token) / command;
		std::error_code ec;
		if (fs::exists(candidate, ec) && !ec && ::access(candidate.c_str(), X_OK) == 0) {
			return candidate.string();
		}
	}
	return {};
}

std::string quoteForGnuplot(const std::string &value) {
	std::string escaped;
	escaped.reserve(value.size() + 2);
	escaped.push_back('\'');
	for (char ch : value) {
		if (ch == '\'') {
			escaped += "''";
		} else {
			escaped.push_back(ch);
		}
	}
	escaped.push_back('\'');
	return escaped;
}

// Owns a scratch directory for one render call.
class ScratchDirectory {
public:
	explicit ScratchDirectory(const std::string &parent) {
		static std::atomic<unsigned> counter{0};
		const fs::path base = parent.empty() ? fs::temp_directory_path() : fs::path(parent);
		path_ = base / ("tsforecast-plot-" + std::to_string(::getpid()) + "-" + std::to_string(counter++));
		fs::create_directories(path_);
	}

	~ScratchDirectory() {
		std::error_code ec;
		fs::remove_all(path_, ec);
		if (ec) {
			TSFORECAST_DEBUG("Could not remove plot scratch directory '{}': {}", path_.string(), ec.message());
		}
	}

	ScratchDirectory(const ScratchDirectory &) = delete;
	ScratchDirectory &operator=(const ScratchDirectory &) = delete;

	const fs::path &path() const {
		return path_;
	}

private:
	fs::path path_;
};

void writeFile(const fs::path &path, const std::string &content) {
	std::ofstream out(path, std::ios::binary);
	if (!out) {
		throw std::runtime_error("Cannot open '" + path.string() + "' for writing.");
	}
	out << content;
	if (!out.good()) {
		throw std::runtime_error("Failed to write '" + path.string() + "'.");
	}
}

std::string curveData(const std::vector<ChartPayload::TimePoint> &dates, const std::vector<double> &values) {
	std::ostringstream out;
	out.precision(12);
	for (std::size_t i = 0; i < dates.size() && i < values.size(); ++i) {
		out << core::calendar::formatTimestamp(dates[i], kDataTimeFormat) << ' ' << values[i] << '\n';
	}
	return out.str();
}

std::string bandData(const ChartPayload::Band &band) {
	std::ostringstream out;
	out.precision(12);
	for (std::size_t i = 0; i < band.dates.size() && i < band.lower.size() && i < band.upper.size(); ++i) {
		out << core::calendar::formatTimestamp(band.dates[i], kDataTimeFormat) << ' ' << band.lower[i] << ' '
		    << band.upper[i] << '\n';
	}
	return out.str();
}

// Runs `executable script` with stderr captured to a file; returns the exit status or -1.
int spawnGnuplot(const std::string &executable, const std::string &script_path, const std::string &stderr_path) {
	const int err_fd = ::open(stderr_path.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644);
	if (err_fd < 0) {
		return -1;
	}

	posix_spawn_file_actions_t actions;
	if (::posix_spawn_file_actions_init(&actions) != 0) {
		::close(err_fd);
		return -1;
	}
	if (::posix_spawn_file_actions_adddup2(&actions, err_fd, STDERR_FILENO) != 0 ||
	    ::posix_spawn_file_actions_addclose(&actions, err_fd) != 0) {
		::posix_spawn_file_actions_destroy(&actions);
		::close(err_fd);
		return -1;
	}

	const char *argv_raw[] = {executable.c_str(), script_path.c_str(), nullptr};
	char *const *argv = const_cast<char *const *>(argv_raw);
	pid_t pid = -1;
	const int spawn_rc = ::posix_spawn(&pid, executable.c_str(), &actions, nullptr, argv, environ);
	::posix_spawn_file_actions_destroy(&actions);
	::close(err_fd);
	if (spawn_rc != 0 || pid <= 0) {
		return -1;
	}

	int status = 0;
	if (::waitpid(pid, &status, 0) < 0) {
		return -1;
	}
	return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

std::string firstLineOf(const fs::path &path) {
	std::ifstream in(path);
	std::string line;
	std::getline(in, line);
	return line;
}

} // namespace

GnuplotRenderer::GnuplotRenderer() : GnuplotRenderer(Options{}) {
}

GnuplotRenderer::GnuplotRenderer(Options options) : options_(std::move(options)) {
	if (options_.width <= 0 || options_.height <= 0) {
		throw std::invalid_argument("Chart dimensions must be positive.");
	}
}

bool GnuplotRenderer::isAvailable() const {
	return !findExecutable(options_.executable).empty();
}

std::string GnuplotRenderer::buildScript(const ChartPayload &payload, const std::string &data_dir,
                                         const std::string &output_path) const {
	const fs::path dir(data_dir);
	std::ostringstream script;
	script << "set terminal pngcairo size " << options_.width << ',' << options_.height << " noenhanced\n";
	script << "set output " << quoteForGnuplot(output_path) << '\n';
	script << "set title " << quoteForGnuplot(payload.title) << '\n';
	script << "set xdata time\n";
	script << "set timefmt " << quoteForGnuplot(kDataTimeFormat) << '\n';
	script << "set format x '%Y-%m'\n";
	script << "set xlabel " << quoteForGnuplot(options_.x_label) << '\n';
	script << "set ylabel " << quoteForGnuplot(options_.y_label) << '\n';
	script << "set grid back lw 1 dt 2\n";
	script << "set key top left\n";
	script << "set style fill transparent solid 0.3 noborder\n";
	script << "plot ";
	if (!payload.interval.dates.empty()) {
		script << quoteForGnuplot((dir / "interval.dat").string())
		       << " using 1:2:3 with filledcurves lc rgb '#dc2626' title " << quoteForGnuplot(payload.interval.label)
		       << ", \\\n     ";
	}
	script << quoteForGnuplot((dir / "history.dat").string()) << " using 1:2 with lines lw 2 lc rgb '#2563eb' title "
	       << quoteForGnuplot(payload.historical.label);
	if (!payload.forecast.dates.empty()) {
		script << ", \\\n     " << quoteForGnuplot((dir / "forecast.dat").string())
		       << " using 1:2 with lines lw 2 dt 2 lc rgb '#dc2626' title " << quoteForGnuplot(payload.forecast.label);
	}
	script << '\n';
	return script.str();
}

std::vector<std::uint8_t> GnuplotRenderer::render(const ChartPayload &payload) const {
	const std::string executable = findExecutable(options_.executable);
	if (executable.empty()) {
		throw std::runtime_error("gnuplot executable '" + options_.executable + "' not found.");
	}
	if (payload.historical.dates.empty()) {
		throw std::runtime_error("Nothing to plot: the historical curve is empty.");
	}

	const ScratchDirectory scratch(options_.work_dir);
	const fs::path output = scratch.path() / "chart.png";
	const fs::path script = scratch.path() / "chart.plt";
	const fs::path errors = scratch.path() / "gnuplot.err";

	writeFile(scratch.path() / "history.dat", curveData(payload.historical.dates, payload.historical.values));
	writeFile(scratch.path() / "forecast.dat", curveData(payload.forecast.dates, payload.forecast.values));
	writeFile(scratch.path() / "interval.dat", bandData(payload.interval));
	writeFile(script, buildScript(payload, scratch.path().string(), output.string()));

	const int rc = spawnGnuplot(executable, script.string(), errors.string());
	std::error_code ec;
	if (rc != 0 || !fs::exists(output, ec)) {
		const std::string detail = firstLineOf(errors);
		throw std::runtime_error("gnuplot failed with status " + std::to_string(rc) +
		                         (detail.empty() ? std::string{} : ": " + detail));
	}

	std::ifstream in(output, std::ios::binary);
	std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
	if (bytes.empty()) {
		throw std::runtime_error("gnuplot produced an empty image.");
	}
	return bytes;
}

} // namespace tsforecast::chart
