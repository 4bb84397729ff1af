#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace netsweep::common
{
    enum class ErrorCode
    {
        NoInterface,
        UnsupportedSubnet
    };

    inline const char *ToString(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::NoInterface:
            return "no-interface";
        case ErrorCode::UnsupportedSubnet:
            return "unsupported-subnet";
        }
        return "unknown";
    }

    // Raised by discovery and subnet validation only. Probe failures never surface as NetworkError.
    class NetworkError : public std::runtime_error
    {
    public:
        NetworkError(ErrorCode code, const std::string &message)
            : std::runtime_error(message), m_code(code)
        {
        }

        static NetworkError NoInterface(const std::string &message)
        {
            return NetworkError(ErrorCode::NoInterface, message);
        }

        static NetworkError UnsupportedSubnet(int prefixLength)
        {
            NetworkError error(ErrorCode::UnsupportedSubnet,
                               "Only /22 or smaller subnets are supported, got /" + std::to_string(prefixLength));
            error.m_prefixLength = prefixLength;
            return error;
        }

        ErrorCode Code() const { return m_code; }
        const char *CodeString() const { return ToString(m_code); }

        // Set for UnsupportedSubnet only.
        std::optional<int> PrefixLength() const { return m_prefixLength; }

    private:
        ErrorCode m_code;
        std::optional<int> m_prefixLength;
    };
}
