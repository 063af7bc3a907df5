#include "port.h"

#include "bindings.h"
#include "common.h"
#include "event.h"

#include <utility>

namespace readyq::iocp {

CompletionPort::~CompletionPort() { reset(); }

CompletionPort::CompletionPort(CompletionPort &&other) noexcept : mPort(std::exchange(other.mPort, nullptr)) {}

CompletionPort &CompletionPort::operator=(CompletionPort &&other) noexcept {
	if (this != &other) {
		reset();
		mPort = std::exchange(other.mPort, nullptr);
	}
	return *this;
}

void CompletionPort::reset() {
	if (!mPort) {
		return;
	}
	VERBOSE_LOG("readyq(iocp): close port=%p\n", mPort);
	if (!CloseHandle(mPort)) {
		DEBUG_LOG("readyq(iocp): CloseHandle(%p) failed: %u\n", mPort, GetLastError());
	}
	mPort = nullptr;
}

DWORD CompletionPort::init() {
	reset();
	HANDLE port = CreateIoCompletionPort(INVALID_HANDLE_VALUE, nullptr, 0, 0);
	if (!port) {
		DWORD err = GetLastError();
		DEBUG_LOG("readyq(iocp): CreateIoCompletionPort failed: %u\n", err);
		return err;
	}
	mPort = port;
	VERBOSE_LOG("readyq(iocp): new port=%p\n", mPort);
	return ERROR_SUCCESS;
}

DWORD CompletionPort::associate(HANDLE file, ULONG_PTR key) {
	VERBOSE_LOG("readyq(iocp): associate port=%p file=%p key=%zu\n", mPort, file, static_cast<size_t>(key));
	if (CreateIoCompletionPort(file, mPort, key, 0) != mPort) {
		DWORD err = GetLastError();
		DEBUG_LOG("readyq(iocp): associating %p failed: %u\n", file, err);
		return err;
	}
	return ERROR_SUCCESS;
}

DWORD CompletionPort::skipCompletionOnSuccess(HANDLE file) {
	if (!SetFileCompletionNotificationModes(file, FILE_SKIP_COMPLETION_PORT_ON_SUCCESS | FILE_SKIP_SET_EVENT_ON_HANDLE)) {
		DWORD err = GetLastError();
		DEBUG_LOG("readyq(iocp): SetFileCompletionNotificationModes(%p) failed: %u\n", file, err);
		return err;
	}
	return ERROR_SUCCESS;
}

DWORD CompletionPort::post(DWORD bytes, ULONG_PTR key, Overlapped *overlapped) {
	if (!PostQueuedCompletionStatus(mPort, bytes, key, overlapped)) {
		DWORD err = GetLastError();
		DEBUG_LOG("readyq(iocp): PostQueuedCompletionStatus failed: %u\n", err);
		return err;
	}
	return ERROR_SUCCESS;
}

DWORD CompletionPort::notify() { return post(0, static_cast<ULONG_PTR>(kNotifyKey), nullptr); }

DWORD CompletionPort::getStatus(std::span<OverlappedEntry> entries, DWORD timeoutMs, bool alertable, ULONG *count) {
	*count = 0;
	if (!GetQueuedCompletionStatusEx(mPort, entries.data(), static_cast<ULONG>(entries.size()), count, timeoutMs,
									 alertable ? 1 : 0)) {
		DWORD err = GetLastError();
		*count = 0;
		if (err == WAIT_TIMEOUT) {
			return ERROR_SUCCESS;
		}
		DEBUG_LOG("readyq(iocp): GetQueuedCompletionStatusEx failed: %u\n", err);
		return err;
	}
	return ERROR_SUCCESS;
}

FARPROC findNtdllProcedure(const char *name) {
	static const WCHAR kNtdll[] = {'n', 't', 'd', 'l', 'l', '.', 'd', 'l', 'l', 0};
	HMODULE ntdll = GetModuleHandleW(kNtdll);
	if (!ntdll) {
		DEBUG_LOG("readyq(iocp): GetModuleHandleW(ntdll) failed: %u\n", GetLastError());
		return nullptr;
	}
	FARPROC proc = GetProcAddress(ntdll, name);
	if (!proc) {
		DEBUG_LOG("readyq(iocp): ntdll!%s not found: %u\n", name, GetLastError());
	}
	return proc;
}

DWORD baseSocket(SOCKET socket, SOCKET *base) {
	DWORD bytes = 0;
	if (WSAIoctl(socket, SIO_BASE_HANDLE, nullptr, 0, base, sizeof(*base), &bytes, nullptr, nullptr) !=
		SOCKET_ERROR) {
		return ERROR_SUCCESS;
	}
	DWORD err = static_cast<DWORD>(WSAGetLastError());
	// Some layered providers refuse SIO_BASE_HANDLE but still answer the poll-specific query.
	if (WSAIoctl(socket, SIO_BSP_HANDLE_POLL, nullptr, 0, base, sizeof(*base), &bytes, nullptr, nullptr) !=
		SOCKET_ERROR) {
		return ERROR_SUCCESS;
	}
	DEBUG_LOG("readyq(iocp): no base handle for socket %zu: %u\n", static_cast<size_t>(socket), err);
	return err;
}

} // namespace readyq::iocp
