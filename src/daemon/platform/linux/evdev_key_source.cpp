#include "platform/linux/evdev_key_source.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <climits>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <filesystem>
#include <linux/input.h>
#include <poll.h>
#include <print>
#include <sys/ioctl.h>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace {

// KEY_A..KEY_Z are not contiguous: they follow the QWERTY rows.
constexpr std::array<int, 26> kLetterCodes = {
    KEY_A, KEY_B, KEY_C, KEY_D, KEY_E, KEY_F, KEY_G, KEY_H, KEY_I,
    KEY_J, KEY_K, KEY_L, KEY_M, KEY_N, KEY_O, KEY_P, KEY_Q, KEY_R,
    KEY_S, KEY_T, KEY_U, KEY_V, KEY_W, KEY_X, KEY_Y, KEY_Z,
};

constexpr size_t kBitsPerLong = sizeof(unsigned long) * CHAR_BIT;

bool test_bit(const std::vector<unsigned long>& bits, int bit) {
    return (bits[bit / kBitsPerLong] >> (bit % kBitsPerLong)) & 1UL;
}

bool reports_key(int fd, int code) {
    std::vector<unsigned long> bits(KEY_MAX / kBitsPerLong + 1, 0);
    if (::ioctl(fd, EVIOCGBIT(EV_KEY, bits.size() * sizeof(unsigned long)), bits.data()) < 0) {
        return false;
    }
    return test_bit(bits, code);
}

} // namespace

LogicalKey EvdevKeyMap::classify(int code) const {
    if (code == modifier_left) return LogicalKey::ModifierLeft;
    if (code == modifier_right) return LogicalKey::ModifierRight;
    if (code == letter) return LogicalKey::Letter;
    return LogicalKey::Other;
}

std::expected<EvdevKeyMap, std::string> make_key_map(const std::string& modifier,
                                                     const std::string& key) {
    EvdevKeyMap map;
    if (modifier == "ctrl") {
        map.modifier_left = KEY_LEFTCTRL;
        map.modifier_right = KEY_RIGHTCTRL;
    } else if (modifier == "alt") {
        map.modifier_left = KEY_LEFTALT;
        map.modifier_right = KEY_RIGHTALT;
    } else if (modifier == "shift") {
        map.modifier_left = KEY_LEFTSHIFT;
        map.modifier_right = KEY_RIGHTSHIFT;
    } else if (modifier == "super") {
        map.modifier_left = KEY_LEFTMETA;
        map.modifier_right = KEY_RIGHTMETA;
    } else {
        return std::unexpected("unknown modifier: " + modifier);
    }

    if (key.size() != 1) {
        return std::unexpected("hotkey must be a single letter: " + key);
    }
    char c = key[0];
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    if (c < 'a' || c > 'z') {
        return std::unexpected("hotkey must be a single letter: " + key);
    }
    map.letter = kLetterCodes[c - 'a'];
    return map;
}

std::optional<KeyTransition> transition_from_value(int value) {
    switch (value) {
        case 1:
        case 2:  return KeyTransition::Down;
        case 0:  return KeyTransition::Up;
        default: return std::nullopt;
    }
}

EvdevKeySource::EvdevKeySource(EvdevKeyMap keys, std::string device, bool verbose)
    : keys_(keys), device_(std::move(device)), verbose_(verbose) {}

EvdevKeySource::~EvdevKeySource() {
    stop();
}

std::expected<int, std::string> EvdevKeySource::open_device() {
    if (!device_.empty()) {
        int fd = ::open(device_.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
        if (fd < 0) {
            return std::unexpected(std::format("open {}: {}", device_, std::strerror(errno)));
        }
        return fd;
    }

    std::vector<fs::path> candidates;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator("/dev/input", ec)) {
        if (entry.path().filename().string().starts_with("event")) {
            candidates.push_back(entry.path());
        }
    }
    std::ranges::sort(candidates);

    for (const auto& path : candidates) {
        int fd = ::open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
        if (fd < 0) continue;
        if (reports_key(fd, keys_.letter) && reports_key(fd, keys_.modifier_left)) {
            device_ = path.string();
            return fd;
        }
        ::close(fd);
    }
    return std::unexpected("no readable keyboard under /dev/input (is the user in the input group?)");
}

std::expected<void, std::string> EvdevKeySource::start(KeyCallback on_key) {
    if (fd_ >= 0) return {};

    auto fd = open_device();
    if (!fd) return std::unexpected(fd.error());
    fd_ = *fd;

    if (verbose_) {
        std::println(stderr, "[holdscribe] Reading keys from {}", device_);
    }

    thread_ = std::jthread([this, on_key = std::move(on_key)](std::stop_token st) {
        run(st, on_key);
    });
    return {};
}

void EvdevKeySource::stop() {
    if (thread_.joinable()) {
        thread_.request_stop();
        thread_.join();
    }
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void EvdevKeySource::run(std::stop_token st, KeyCallback on_key) {
    std::array<input_event, 64> events;
    pollfd pfd{fd_, POLLIN, 0};

    while (!st.stop_requested()) {
        int ret = ::poll(&pfd, 1, 200);
        if (ret < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "hotkey: poll failed: {}", std::strerror(errno));
            return;
        }
        if (ret == 0) continue;
        if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
            std::println(stderr, "hotkey: device {} went away", device_);
            return;
        }

        ssize_t n = ::read(fd_, events.data(), sizeof(events));
        if (n < 0) {
            if (errno == EAGAIN || errno == EINTR) continue;
            std::println(stderr, "hotkey: read failed: {}", std::strerror(errno));
            return;
        }

        size_t count = static_cast<size_t>(n) / sizeof(input_event);
        for (size_t i = 0; i < count; ++i) {
            const auto& ev = events[i];
            if (ev.type != EV_KEY) continue;

            auto key = keys_.classify(ev.code);
            if (key == LogicalKey::Other) continue;

            if (auto transition = transition_from_value(ev.value)) {
                on_key(key, *transition);
            }
        }
    }
}
