#include "InterfaceParsers.hpp"

#include <algorithm>
#include <exception>
#include <sstream>

namespace netsweep::scanner
{
    namespace
    {
        std::vector<std::string> SplitWhitespace(const std::string &line)
        {
            std::vector<std::string> tokens;
            std::stringstream ss(line);
            std::string token;
            while (ss >> token)
                tokens.push_back(token);
            return tokens;
        }

        std::vector<std::string> SplitLines(const std::string &text)
        {
            std::vector<std::string> lines;
            std::stringstream ss(text);
            std::string line;
            while (std::getline(ss, line))
                lines.push_back(line);
            return lines;
        }

        bool StartsWith(const std::string &text, const std::string &prefix)
        {
            return text.compare(0, prefix.size(), prefix) == 0;
        }

        bool MentionsAddress(const std::vector<std::string> &tokens, const std::string &ip)
        {
            for (const auto &token : tokens)
            {
                if (token == ip || token == "addr:" + ip)
                    return true;
            }
            return false;
        }

        std::optional<common::HostAddress> NetmaskOnLine(const std::vector<std::string> &tokens)
        {
            for (size_t k = 0; k < tokens.size(); ++k)
            {
                if (tokens[k] == "netmask" && k + 1 < tokens.size())
                    return ParseNetmaskValue(tokens[k + 1]);
                if (StartsWith(tokens[k], "Mask:"))
                    return ParseNetmaskValue(tokens[k].substr(5));
            }
            return std::nullopt;
        }
    }

    std::vector<std::string> ParseDefaultRouteInterfaces(std::istream &routeTable)
    {
        std::vector<std::string> interfaces;
        std::string line;

        // Header row.
        if (!std::getline(routeTable, line))
            return interfaces;

        while (std::getline(routeTable, line))
        {
            std::stringstream ss(line);
            std::string iface, destination;
            if (!(ss >> iface >> destination))
                continue;
            if (destination != "00000000")
                continue;
            if (std::find(interfaces.begin(), interfaces.end(), iface) == interfaces.end())
                interfaces.push_back(iface);
        }
        return interfaces;
    }

    std::optional<common::HostAddress> ParseNetmaskValue(const std::string &text)
    {
        if (text.empty())
            return std::nullopt;

        uint32_t value = 0;
        if (StartsWith(text, "0x") || StartsWith(text, "0X"))
        {
            std::string digits = text.substr(2);
            if (digits.empty() || digits.size() > 8 || digits.find_first_not_of("0123456789abcdefABCDEF") != std::string::npos)
                return std::nullopt;
            value = static_cast<uint32_t>(std::stoul(digits, nullptr, 16));
        }
        else
        {
            try
            {
                value = common::IpToInt(common::Subnet::Parse(text + "/32").NetworkAddress());
            }
            catch (const std::exception &)
            {
                return std::nullopt;
            }
        }

        if (!common::IsContiguousMask(value))
            return std::nullopt;
        return common::IntToIp(value);
    }

    std::optional<common::HostAddress> ParseIfconfigNetmask(const std::string &output, const common::HostAddress &localIp)
    {
        const std::string ip = localIp.to_string();
        const std::vector<std::string> lines = SplitLines(output);

        for (size_t i = 0; i < lines.size(); ++i)
        {
            if (!MentionsAddress(SplitWhitespace(lines[i]), ip))
                continue;

            // Same line first, then the neighbours closest to it, preferring the lines that follow.
            const int offsets[] = {0, 1, 2, -1, -2};
            for (int offset : offsets)
            {
                long j = static_cast<long>(i) + offset;
                if (j < 0 || j >= static_cast<long>(lines.size()))
                    continue;

                auto mask = NetmaskOnLine(SplitWhitespace(lines[j]));
                if (mask)
                    return mask;
            }
        }
        return std::nullopt;
    }

    std::optional<int> ParseIpAddrPrefixLength(const std::string &output, const common::HostAddress &localIp)
    {
        const std::string wanted = localIp.to_string() + "/";

        for (const auto &line : SplitLines(output))
        {
            auto tokens = SplitWhitespace(line);
            for (size_t k = 0; k + 1 < tokens.size(); ++k)
            {
                if (tokens[k] != "inet" || !StartsWith(tokens[k + 1], wanted))
                    continue;

                std::string prefix = tokens[k + 1].substr(wanted.size());
                if (prefix.empty() || prefix.size() > 2 || prefix.find_first_not_of("0123456789") != std::string::npos)
                    return std::nullopt;

                int value = std::stoi(prefix);
                if (value > 32)
                    return std::nullopt;
                return value;
            }
        }
        return std::nullopt;
    }
}
