#include "GuardDog/RegistryReader.hpp"

#ifdef _WIN32
#include <windows.h>
#include <vector>
#endif

namespace guarddog {

#ifdef _WIN32

namespace {

HKEY rootKey(RegistryHive hive) {
    return hive == RegistryHive::LocalMachine ? HKEY_LOCAL_MACHINE : HKEY_CURRENT_USER;
}

} // namespace

std::optional<std::uint32_t> WindowsRegistryReader::readDword(RegistryHive hive, const std::string &subkey,
                                                              const std::string &value) const {
    DWORD data = 0;
    DWORD size = sizeof(data);
    const LONG status =
        RegGetValueA(rootKey(hive), subkey.c_str(), value.c_str(), RRF_RT_REG_DWORD, nullptr, &data, &size);
    if (status != ERROR_SUCCESS) {
        return std::nullopt;
    }
    return static_cast<std::uint32_t>(data);
}

std::optional<std::string> WindowsRegistryReader::readString(RegistryHive hive, const std::string &subkey,
                                                             const std::string &value) const {
    DWORD size = 0;
    LONG status = RegGetValueA(rootKey(hive), subkey.c_str(), value.c_str(), RRF_RT_REG_SZ | RRF_RT_REG_EXPAND_SZ,
                               nullptr, nullptr, &size);
    if (status != ERROR_SUCCESS || size == 0) {
        return std::nullopt;
    }
    std::vector<char> buffer(size);
    status = RegGetValueA(rootKey(hive), subkey.c_str(), value.c_str(), RRF_RT_REG_SZ | RRF_RT_REG_EXPAND_SZ,
                          nullptr, buffer.data(), &size);
    if (status != ERROR_SUCCESS) {
        return std::nullopt;
    }
    return std::string(buffer.data());
}

#else

std::optional<std::uint32_t> WindowsRegistryReader::readDword(RegistryHive, const std::string &,
                                                              const std::string &) const {
    return std::nullopt;
}

std::optional<std::string> WindowsRegistryReader::readString(RegistryHive, const std::string &,
                                                             const std::string &) const {
    return std::nullopt;
}

#endif

} // namespace guarddog
