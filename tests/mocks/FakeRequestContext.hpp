#pragma once

#include "ports/output/IRequestContext.hpp"
#include <algorithm>
#include <cctype>
#include <map>

namespace webauth::tests::mocks {

class FakeRequestContext : public ports::output::IRequestContext {
public:
    explicit FakeRequestContext(std::string clientAddress = "127.0.0.1",
                                std::string userAgent = "TestAgent/1.0")
        : clientAddress_(std::move(clientAddress))
    {
        setHeader("User-Agent", userAgent);
    }

    std::optional<std::string> formField(const std::string& name) const override {
        auto it = fields_.find(name);
        if (it == fields_.end()) return std::nullopt;
        return it->second;
    }

    std::optional<std::string> header(const std::string& name) const override {
        auto it = headers_.find(toLower(name));
        if (it == headers_.end()) return std::nullopt;
        return it->second;
    }

    std::string clientAddress() const override {
        return clientAddress_;
    }

    // Test helpers
    void setField(const std::string& name, const std::string& value) { fields_[name] = value; }
    void setHeader(const std::string& name, const std::string& value) { headers_[toLower(name)] = value; }
    void setClientAddress(const std::string& address) { clientAddress_ = address; }

private:
    std::string clientAddress_;
    std::map<std::string, std::string> fields_;
    std::map<std::string, std::string> headers_;

    static std::string toLower(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value;
    }
};

} // namespace webauth::tests::mocks
