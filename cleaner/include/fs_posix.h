// include/fs_posix.h
#pragma once
#include <string>
#include <filesystem>
#include <sys/types.h>

namespace mahito {

// open(2) read-only without moving atime when the kernel allows it
// (O_NOATIME needs ownership or CAP_FOWNER). Returns -1 with errno set.
int openReadNoAtime(const std::filesystem::path& p);

// Effective CAP_CHOWN of the calling thread.
bool hasChownCapability();

// Accepts a user name or a numeric uid.
bool resolveUser(const std::string& nameOrUid, uid_t& out, std::string& err);

std::string userName(uid_t uid);
std::string groupName(gid_t gid);

std::string errnoText(int err);

} // namespace mahito
