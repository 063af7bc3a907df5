#pragma once

#include "bindings.h"
#include "types.h"

#ifdef _WIN32

#include <span>

namespace readyq::iocp {

/**
 * Owns one completion port. Every call maps onto a single kernel32 function and returns ERROR_SUCCESS or the
 * thread's last error.
 */
class CompletionPort {
  public:
	CompletionPort() = default;
	~CompletionPort();
	CompletionPort(const CompletionPort &) = delete;
	CompletionPort &operator=(const CompletionPort &) = delete;
	CompletionPort(CompletionPort &&other) noexcept;
	CompletionPort &operator=(CompletionPort &&other) noexcept;

	DWORD init();
	[[nodiscard]] HANDLE handle() const noexcept { return mPort; }

	DWORD associate(HANDLE file, ULONG_PTR key);
	DWORD skipCompletionOnSuccess(HANDLE file);
	DWORD post(DWORD bytes, ULONG_PTR key, Overlapped *overlapped);
	// Queues a zero-byte entry under kNotifyKey.
	DWORD notify();
	// A timeout is reported as success with *count set to 0.
	DWORD getStatus(std::span<OverlappedEntry> entries, DWORD timeoutMs, bool alertable, ULONG *count);

  private:
	void reset();

	HANDLE mPort = nullptr;
};

// Looks up an ntdll export such as NtCreateFile or NtDeviceIoControlFile. Returns null if it is missing.
FARPROC findNtdllProcedure(const char *name);

// Maps a socket to its base provider handle, skipping any layered service providers. The AFD driver only
// accepts base handles.
DWORD baseSocket(SOCKET socket, SOCKET *base);

} // namespace readyq::iocp

#endif
