#include "sscope/instance_key.hpp"

namespace sscope {

bool InstanceKey::isValid() const {
    return !address.isEmpty() && port > 0 && port < 65536;
}

QString InstanceKey::toString() const {
    if (address.contains(':')) {
        return QString("[%1]:%2").arg(address).arg(port);
    }
    return QString("%1:%2").arg(address).arg(port);
}

InstanceKey InstanceKey::fromUri(const QString& uri, int defaultPort) {
    QString text = uri.trimmed();
    const int schemeEnd = text.indexOf("://");
    if (schemeEnd >= 0) {
        text = text.mid(schemeEnd + 3);
    }
    const int pathStart = text.indexOf('/');
    if (pathStart >= 0) {
        text = text.left(pathStart);
    }
    const int userInfoEnd = text.lastIndexOf('@');
    if (userInfoEnd >= 0) {
        text = text.mid(userInfoEnd + 1);
    }
    if (text.isEmpty()) {
        return {};
    }

    QString host;
    QString portText;
    if (text.startsWith('[')) {
        const int close = text.indexOf(']');
        if (close < 0) {
            return {};
        }
        host = text.mid(1, close - 1);
        const QString rest = text.mid(close + 1);
        if (rest.startsWith(':')) {
            portText = rest.mid(1);
        } else if (!rest.isEmpty()) {
            return {};
        }
    } else if (text.count(':') == 1) {
        host = text.section(':', 0, 0);
        portText = text.section(':', 1, 1);
    } else if (text.count(':') > 1) {
        // Unbracketed IPv6 literal carries no port.
        host = text;
    } else {
        host = text;
    }

    int port = defaultPort;
    if (!portText.isEmpty()) {
        bool ok = false;
        port = portText.toInt(&ok);
        if (!ok) {
            return {};
        }
    }

    InstanceKey key(host, port);
    return key.isValid() ? key : InstanceKey{};
}

}  // namespace sscope
