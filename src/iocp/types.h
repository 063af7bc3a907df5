#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <type_traits>

// Binary layouts and constants of the Windows completion-port family. The structures must match the operating
// system's definitions byte for byte; the assertions at the end of this file pin them for both pointer widths.

namespace readyq::iocp {

using BOOL = int;
using DWORD = uint32_t;
using ULONG = uint32_t;
using ULONG_PTR = uintptr_t;
using NTSTATUS = int32_t;
using HANDLE = void *;
using HMODULE = void *;
using WCHAR = uint16_t;
using SOCKET = uintptr_t;

inline const HANDLE INVALID_HANDLE_VALUE = reinterpret_cast<HANDLE>(static_cast<intptr_t>(-1));

constexpr DWORD INFINITE = 0xFFFFFFFF;

constexpr NTSTATUS STATUS_SUCCESS = 0;
constexpr NTSTATUS STATUS_PENDING = 0x00000103;
constexpr NTSTATUS STATUS_INVALID_HANDLE = static_cast<NTSTATUS>(0xC0000008);
constexpr NTSTATUS STATUS_UNEXPECTED_IO_ERROR = static_cast<NTSTATUS>(0xC00000E9);
constexpr NTSTATUS STATUS_CANCELLED = static_cast<NTSTATUS>(0xC0000120);
constexpr NTSTATUS STATUS_PIPE_BROKEN = static_cast<NTSTATUS>(0xC000014B);
constexpr NTSTATUS STATUS_NOT_FOUND = static_cast<NTSTATUS>(0xC0000225);

constexpr DWORD ERROR_SUCCESS = 0;
constexpr DWORD ERROR_INVALID_HANDLE = 6;
constexpr DWORD ERROR_BROKEN_PIPE = 109;
constexpr DWORD WAIT_TIMEOUT = 258;
constexpr DWORD ERROR_MR_MID_NOT_FOUND = 317;
constexpr DWORD ERROR_OPERATION_ABORTED = 995;
constexpr DWORD ERROR_IO_PENDING = 997;
constexpr DWORD ERROR_NOT_FOUND = 1168;

constexpr int SOCKET_ERROR = -1;

// WSAIoctl codes that map a layered socket to the provider's own handle.
constexpr DWORD SIO_BASE_HANDLE = 0x48000022;
constexpr DWORD SIO_BSP_HANDLE_POLL = 0x4800001D;

// NtCreateFile arguments used to open the AFD device.
constexpr ULONG FILE_OPEN = 1;
constexpr ULONG FILE_SHARE_READ = 0x1;
constexpr ULONG FILE_SHARE_WRITE = 0x2;
constexpr DWORD SYNCHRONIZE = 0x00100000;

// SetFileCompletionNotificationModes flags
constexpr uint8_t FILE_SKIP_COMPLETION_PORT_ON_SUCCESS = 0x1;
constexpr uint8_t FILE_SKIP_SET_EVENT_ON_HANDLE = 0x2;

/**
 * OVERLAPPED. The third field is a union in the Windows headers: either an Offset/OffsetHigh pair giving the
 * file position of the request, or a single pointer. The two views are mutually exclusive; the accessors
 * reinterpret the same eight bytes according to which one the caller is using.
 */
struct Overlapped {
	ULONG_PTR Internal = 0;
	ULONG_PTR InternalHigh = 0;
	alignas(alignof(void *)) unsigned char OffsetOrPointer[8] = {};
	HANDLE hEvent = nullptr;

	[[nodiscard]] DWORD offsetLow() const { return loadDword(0); }
	[[nodiscard]] DWORD offsetHigh() const { return loadDword(sizeof(DWORD)); }
	[[nodiscard]] uint64_t offset() const {
		return (static_cast<uint64_t>(offsetHigh()) << 32) | static_cast<uint64_t>(offsetLow());
	}
	void setOffset(uint64_t offset) {
		storeDword(0, static_cast<DWORD>(offset & 0xFFFFFFFFu));
		storeDword(sizeof(DWORD), static_cast<DWORD>(offset >> 32));
	}

	[[nodiscard]] void *pointer() const {
		void *value;
		std::memcpy(&value, OffsetOrPointer, sizeof(value));
		return value;
	}
	void setPointer(void *value) {
		std::memset(OffsetOrPointer, 0, sizeof(OffsetOrPointer));
		std::memcpy(OffsetOrPointer, &value, sizeof(value));
	}

	// Internal holds the request's NTSTATUS once the kernel has picked it up.
	[[nodiscard]] NTSTATUS status() const { return static_cast<NTSTATUS>(static_cast<uint32_t>(Internal)); }

  private:
	[[nodiscard]] DWORD loadDword(size_t at) const {
		DWORD value;
		std::memcpy(&value, OffsetOrPointer + at, sizeof(value));
		return value;
	}
	void storeDword(size_t at, DWORD value) { std::memcpy(OffsetOrPointer + at, &value, sizeof(value)); }
};

// OVERLAPPED_ENTRY, as filled in by GetQueuedCompletionStatusEx.
struct OverlappedEntry {
	ULONG_PTR lpCompletionKey = 0;
	Overlapped *lpOverlapped = nullptr;
	ULONG_PTR Internal = 0;
	DWORD dwNumberOfBytesTransferred = 0;
};

// IO_STATUS_BLOCK. Like Overlapped, the first field is a Status/Pointer union kept as raw bytes.
struct IoStatusBlock {
	alignas(alignof(void *)) unsigned char StatusOrPointer[sizeof(void *)] = {};
	ULONG_PTR Information = 0;

	[[nodiscard]] NTSTATUS status() const {
		NTSTATUS value;
		std::memcpy(&value, StatusOrPointer, sizeof(value));
		return value;
	}
	void setStatus(NTSTATUS value) {
		std::memset(StatusOrPointer, 0, sizeof(StatusOrPointer));
		std::memcpy(StatusOrPointer, &value, sizeof(value));
	}
	[[nodiscard]] void *pointer() const {
		void *value;
		std::memcpy(&value, StatusOrPointer, sizeof(value));
		return value;
	}
	void setPointer(void *value) { std::memcpy(StatusOrPointer, &value, sizeof(value)); }
};

struct UnicodeString {
	uint16_t Length = 0;
	uint16_t MaximumLength = 0;
	WCHAR *Buffer = nullptr;
};

struct ObjectAttributes {
	ULONG Length = 0;
	HANDLE RootDirectory = nullptr;
	UnicodeString *ObjectName = nullptr;
	ULONG Attributes = 0;
	void *SecurityDescriptor = nullptr;
	void *SecurityQualityOfService = nullptr;
};

static_assert(std::is_standard_layout_v<Overlapped>);
static_assert(std::is_trivially_copyable_v<Overlapped>);
static_assert(std::is_standard_layout_v<OverlappedEntry>);
static_assert(std::is_trivially_copyable_v<OverlappedEntry>);

static_assert(offsetof(Overlapped, Internal) == 0);
static_assert(offsetof(Overlapped, InternalHigh) == sizeof(ULONG_PTR));
static_assert(offsetof(Overlapped, OffsetOrPointer) == 2 * sizeof(ULONG_PTR));
static_assert(offsetof(Overlapped, hEvent) == 2 * sizeof(ULONG_PTR) + 8);
static_assert(sizeof(Overlapped) == (sizeof(void *) == 8 ? 32 : 20));

static_assert(offsetof(OverlappedEntry, lpCompletionKey) == 0);
static_assert(offsetof(OverlappedEntry, lpOverlapped) == sizeof(ULONG_PTR));
static_assert(offsetof(OverlappedEntry, Internal) == 2 * sizeof(ULONG_PTR));
static_assert(offsetof(OverlappedEntry, dwNumberOfBytesTransferred) == 3 * sizeof(ULONG_PTR));
static_assert(sizeof(OverlappedEntry) == (sizeof(void *) == 8 ? 32 : 16));

static_assert(std::is_standard_layout_v<IoStatusBlock>);
static_assert(std::is_standard_layout_v<UnicodeString>);
static_assert(std::is_standard_layout_v<ObjectAttributes>);

static_assert(offsetof(IoStatusBlock, Information) == sizeof(void *));
static_assert(sizeof(IoStatusBlock) == 2 * sizeof(void *));

static_assert(offsetof(UnicodeString, MaximumLength) == 2);
static_assert(offsetof(UnicodeString, Buffer) == sizeof(void *));
static_assert(sizeof(UnicodeString) == 2 * sizeof(void *));

static_assert(offsetof(ObjectAttributes, RootDirectory) == sizeof(void *));
static_assert(offsetof(ObjectAttributes, ObjectName) == 2 * sizeof(void *));
static_assert(offsetof(ObjectAttributes, Attributes) == 3 * sizeof(void *));
static_assert(offsetof(ObjectAttributes, SecurityDescriptor) == 4 * sizeof(void *));
static_assert(sizeof(ObjectAttributes) == (sizeof(void *) == 8 ? 48 : 24));

} // namespace readyq::iocp
