#pragma once

#include "iocp/types.h"

#include <cerrno>
#include <cstdint>

namespace readyq {

// Change-list receipt codes that only report a race with the handle being closed.
inline bool isBenignChangeError(intptr_t code) { return code == ENOENT || code == EPIPE; }

} // namespace readyq

namespace readyq::iocp {

enum class IoStatus {
	Success,
	Pending,
	Cancelled,
	NotFound,
	Failed,
};

IoStatus classifyStatus(NTSTATUS status);
IoStatus classifyWinError(DWORD error);
DWORD winErrorFromNtStatus(NTSTATUS status);
NTSTATUS statusFromWinError(DWORD error);
const char *ioStatusName(IoStatus status);

} // namespace readyq::iocp
