// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

namespace sig {

// Base class of every error raised by signet itself.
struct SignetError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Raw input failed a field-level check. Recoverable by asking again.
class ValidationError : public SignetError {
public:
  ValidationError(std::string_view field, std::string_view reason);

  auto field() const noexcept -> std::string const& { return mField; }
  auto reason() const noexcept -> std::string const& { return mReason; }

private:
  std::string mField;
  std::string mReason;
};

// A single render request failed: font resolution, logo decoding, encoding.
class RenderError : public SignetError {
public:
  RenderError(std::string_view operation, std::string_view reason);

  auto operation() const noexcept -> std::string const& { return mOperation; }
  auto reason() const noexcept -> std::string const& { return mReason; }

private:
  std::string mOperation;
  std::string mReason;
};

// The configuration document or an override is unusable. Fatal at startup.
class ConfigError : public SignetError {
public:
  ConfigError(std::string_view key, std::string_view reason);

  auto key() const noexcept -> std::string const& { return mKey; }
  auto reason() const noexcept -> std::string const& { return mReason; }

private:
  std::string mKey;
  std::string mReason;
};

class ProfileError : public SignetError {
public:
  ProfileError(std::string_view profile, std::string_view reason);

  auto profile() const noexcept -> std::string const& { return mProfile; }
  auto reason() const noexcept -> std::string const& { return mReason; }

private:
  std::string mProfile;
  std::string mReason;
};

class FileSystemError : public SignetError {
public:
  FileSystemError(std::string_view operation, std::filesystem::path path,
                  std::string_view reason);

  auto operation() const noexcept -> std::string const& { return mOperation; }
  auto path() const noexcept -> std::filesystem::path const& { return mPath; }
  auto reason() const noexcept -> std::string const& { return mReason; }

private:
  std::string mOperation;
  std::filesystem::path mPath;
  std::string mReason;
};

} // namespace sig
