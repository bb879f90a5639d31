#pragma once

#include <string_view>

namespace sg::errors::msg {
// Centralized message catalog.
inline constexpr std::string_view kPasswordTooShort{"Password too short (minimum 8 characters)"};
inline constexpr std::string_view kPasswordTooLong{"Password too long"};
inline constexpr std::string_view kPasswordsDoNotMatch{"Passwords do not match"};
inline constexpr std::string_view kLockedOut{"Too many failed attempts; access is temporarily locked"};
inline constexpr std::string_view kCorruptStore{"Authentication settings are unreadable or malformed"};
inline constexpr std::string_view kCredentialAlreadySet{"A password is already configured"};
inline constexpr std::string_view kNoCredentialSet{"No password is configured"};
inline constexpr std::string_view kSessionLocked{"Operation requires an unlocked session"};
inline constexpr std::string_view kResetTicketInvalid{"Credential reset ticket is invalid or already used"};
inline constexpr std::string_view kSettingsTruncated{"Authentication settings file truncated"};
inline constexpr std::string_view kSettingsBadMagic{"Authentication settings file has an unknown format"};
inline constexpr std::string_view kSettingsVersion{"Authentication settings file version unsupported"};
inline constexpr std::string_view kSettingsIntegrity{"Authentication settings integrity check failed"};
inline constexpr std::string_view kSettingsTlvMalformed{"Authentication settings record malformed"};
inline constexpr std::string_view kSettingsInvariant{"Authentication settings violate record invariants"};
inline constexpr std::string_view kPersistSettingsFailed{"Failed to persist authentication settings"};
inline constexpr std::string_view kHashCostOutOfRange{"Hash cost outside supported range"};
}  // namespace sg::errors::msg
