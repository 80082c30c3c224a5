#include "connection_target.hpp"
#include <cstdio>
#include <sstream>

namespace {

    // libpq conninfo value: single-quoted, with \ and ' backslash-escaped
    std::string conninfo_value(const std::string& v) {
        std::string out = "'";
        for (char c : v) {
            if (c == '\\' || c == '\'') out += '\\';
            out += c;
        }
        return out + "'";
    }

    bool unreserved(unsigned char c) {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')
            || c == '-' || c == '.' || c == '_' || c == '~';
    }
}

std::string url_encode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (unreserved(c)) {
            out += static_cast<char>(c);
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

ConnectionTarget::ConnectionTarget(std::string host, int port, std::string user, std::string password, std::string dbname)
    : host_(std::move(host))
    , port_(port)
    , user_(std::move(user))
    , password_(std::move(password))
    , dbname_(std::move(dbname)) { }

ConnectionTarget ConnectionTarget::with_database(const std::string& dbname) const {
    return ConnectionTarget(host_, port_, user_, password_, dbname);
}

std::string ConnectionTarget::conninfo() const {
    std::ostringstream ss;
    ss << "host=" << conninfo_value(host_)
       << " port=" << conninfo_value(std::to_string(port_))
       << " dbname=" << conninfo_value(dbname_)
       << " user=" << conninfo_value(user_);
    if (!password_.empty()) ss << " password=" << conninfo_value(password_);
    ss << " connect_timeout='10'";
    return ss.str();
}

std::string ConnectionTarget::url_with(const std::string& password) const {
    std::string out = "postgresql://" + url_encode(user_);
    if (!password.empty()) out += ":" + password;
    // bare IPv6 literals need brackets
    std::string host = host_.find(':') != std::string::npos ? "[" + host_ + "]" : host_;
    out += "@" + host + ":" + std::to_string(port_) + "/" + url_encode(dbname_);
    return out;
}

std::string ConnectionTarget::url(bool with_password) const {
    return url_with(with_password ? url_encode(password_) : "");
}

std::string ConnectionTarget::redacted_url() const {
    return url_with(password_.empty() ? "" : "***");
}
