#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace gitdock::consts {

// Bare repository layout
inline constexpr std::string_view kObjectsDir    = "objects";
inline constexpr std::string_view kRefsDir       = "refs";
inline constexpr std::string_view kHeadsDir      = "heads";
inline constexpr std::string_view kTagsDir       = "tags";
inline constexpr std::string_view kHeadFile      = "HEAD";
inline constexpr std::string_view kDefaultBranch = "main";
inline constexpr std::string_view kLockSuffix    = ".lock";
// Marks the temp sibling of a file being replaced.
inline constexpr std::string_view kTmpMarker     = ".tmp-";
inline constexpr std::string_view kIncomingPrefix = "incoming-";
inline constexpr std::string_view kRepoSuffix    = ".git";

// Git object type strings
inline constexpr std::string_view kTypeBlob   = "blob";
inline constexpr std::string_view kTypeTree   = "tree";
inline constexpr std::string_view kTypeCommit = "commit";
inline constexpr std::string_view kTypeTag    = "tag";

// File modes (octal)
inline constexpr std::uint32_t kModeFile    = 0100644;
inline constexpr std::uint32_t kModeExec    = 0100755;
inline constexpr std::uint32_t kModeSymlink = 0120000;
inline constexpr std::uint32_t kModeTree    = 0040000;
inline constexpr std::uint32_t kModeGitlink = 0160000;

// Object ID sizes
inline constexpr std::size_t kOidRawLen = 20;
inline constexpr std::size_t kOidHexLen = 40;

inline constexpr std::size_t kFanoutDirHexLen = 2;

// Commit / tag header prefixes
inline constexpr std::string_view kTreePrefix      = "tree ";
inline constexpr std::string_view kParentPrefix    = "parent ";
inline constexpr std::string_view kAuthorPrefix    = "author ";
inline constexpr std::string_view kCommitterPrefix = "committer ";
inline constexpr std::string_view kObjectPrefix    = "object ";
inline constexpr std::string_view kRefPrefix       = "ref: ";

inline constexpr char kSpace = ' ';
inline constexpr char kNul   = '\0';
inline constexpr char kLF    = '\n';

// Transport
inline constexpr int kDefaultPort = 2222;
inline constexpr std::string_view kAuthContext = std::string_view("gitdock-auth-v1\0", 16);
inline constexpr std::size_t kNonceLen = 32;
inline constexpr std::uint32_t kMaxFramePayload = 1U << 20;
inline constexpr std::string_view kGuestUser = "guest";

// Channel services
inline constexpr std::string_view kUploadPack    = "git-upload-pack";
inline constexpr std::string_view kReceivePack   = "git-receive-pack";
inline constexpr std::string_view kUploadArchive = "git-upload-archive";

// pkt-line
inline constexpr std::size_t kPktHeaderLen  = 4;
inline constexpr std::size_t kPktMaxPayload = 65516;

// Pack stream
inline constexpr std::string_view kPackMagic = "PACK";
inline constexpr std::uint32_t kPackVersion = 2;

// Defaults for ServerConfig
inline constexpr std::size_t kDefaultRoundLimit = 64;
inline constexpr std::chrono::milliseconds kDefaultRoundTimeout{30000};
inline constexpr std::size_t kDefaultCacheBudget = 64U * 1024U * 1024U;

} // namespace gitdock::consts
