#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace zf::engine
{

// Payload-less, fire-and-forget "committed state changed" notification.
class ChangeBroadcaster
{
  public:
    virtual ~ChangeBroadcaster() = default;
    // Returns false when the broadcast could not be delivered; callers log
    // and carry on.
    virtual bool broadcast() = 0;
};

// Cross-process broadcaster: atomically replaces a marker file next to the
// store with a fresh generation token. Any number of broadcasts between two
// polls coalesce into one observed change.
class MarkerFileBroadcaster : public ChangeBroadcaster
{
  public:
    explicit MarkerFileBroadcaster(std::filesystem::path marker_path);

    bool broadcast() override;
    std::filesystem::path const &path() const noexcept { return path_; }

  private:
    std::filesystem::path path_;
};

// Reader side of the marker file. Remembers the last token it saw.
class ChangeWatcher
{
  public:
    explicit ChangeWatcher(std::filesystem::path marker_path);

    // True when the marker changed since construction or the previous
    // poll that returned true.
    bool poll();
    std::optional<std::string> const &last_token() const noexcept
    {
        return last_token_;
    }

  private:
    std::filesystem::path path_;
    std::optional<std::string> last_token_;
};

// Token currently stored in the marker file, if any.
std::optional<std::string>
read_marker_token(std::filesystem::path const &marker_path);

// Generation number parsed from a token, 0 when the token is malformed.
std::uint64_t marker_generation(std::string const &token);

} // namespace zf::engine
