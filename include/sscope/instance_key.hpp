#pragma once

#include <QHashFunctions>
#include <QString>

#include <utility>

namespace sscope {

constexpr int kDefaultManagementPort = 8089;

// (address, port) identity of one splunkd instance. Addresses are compared as
// exact strings: a hostname and the IP it resolves to are different keys.
struct InstanceKey {
    QString address;
    int port = kDefaultManagementPort;

    InstanceKey() = default;
    InstanceKey(QString addressValue, int portValue)
        : address(std::move(addressValue)),
          port(portValue) {}

    [[nodiscard]] bool isValid() const;
    [[nodiscard]] QString toString() const;

    // Accepts "https://host:port/path", "host:port", "[v6]:port" and a bare
    // host. Returns an invalid key when nothing usable is found.
    static InstanceKey fromUri(const QString& uri, int defaultPort = kDefaultManagementPort);
};

inline bool operator==(const InstanceKey& lhs, const InstanceKey& rhs) {
    return lhs.port == rhs.port && lhs.address == rhs.address;
}

inline bool operator!=(const InstanceKey& lhs, const InstanceKey& rhs) {
    return !(lhs == rhs);
}

inline bool operator<(const InstanceKey& lhs, const InstanceKey& rhs) {
    if (lhs.address != rhs.address) {
        return lhs.address < rhs.address;
    }
    return lhs.port < rhs.port;
}

inline size_t qHash(const InstanceKey& key, size_t seed = 0) noexcept {
    return qHashMulti(seed, key.address, key.port);
}

}  // namespace sscope
