#pragma once

#include "types.h"

#ifdef _WIN32

#if defined(__i386__) || defined(_M_IX86)
#define READYQ_WINAPI __stdcall
#else
#define READYQ_WINAPI
#endif

// kernel32 and ws2_32 entry points of the completion-port family, declared against the layouts in types.h
// rather than through <windows.h>.

namespace readyq::iocp {

using FARPROC = intptr_t(READYQ_WINAPI *)();
using WsaCompletionRoutine = void(READYQ_WINAPI *)(DWORD dwError, DWORD cbTransferred, Overlapped *lpOverlapped,
												  DWORD dwFlags);

extern "C" {

HANDLE READYQ_WINAPI CreateIoCompletionPort(HANDLE FileHandle, HANDLE ExistingCompletionPort, ULONG_PTR CompletionKey,
											DWORD NumberOfConcurrentThreads);
BOOL READYQ_WINAPI GetQueuedCompletionStatusEx(HANDLE CompletionPort, OverlappedEntry *lpCompletionPortEntries,
											   ULONG ulCount, ULONG *ulNumEntriesRemoved, DWORD dwMilliseconds,
											   BOOL fAlertable);
BOOL READYQ_WINAPI PostQueuedCompletionStatus(HANDLE CompletionPort, DWORD dwNumberOfBytesTransferred,
											  ULONG_PTR dwCompletionKey, Overlapped *lpOverlapped);
BOOL READYQ_WINAPI SetFileCompletionNotificationModes(HANDLE FileHandle, uint8_t Flags);
BOOL READYQ_WINAPI CloseHandle(HANDLE hObject);
DWORD READYQ_WINAPI GetLastError();
HMODULE READYQ_WINAPI GetModuleHandleW(const WCHAR *lpModuleName);
FARPROC READYQ_WINAPI GetProcAddress(HMODULE hModule, const char *lpProcName);

// ws2_32
int READYQ_WINAPI WSAIoctl(SOCKET s, DWORD dwIoControlCode, void *lpvInBuffer, DWORD cbInBuffer, void *lpvOutBuffer,
						   DWORD cbOutBuffer, DWORD *lpcbBytesReturned, Overlapped *lpOverlapped,
						   WsaCompletionRoutine lpCompletionRoutine);
int READYQ_WINAPI WSAGetLastError();

} // extern "C"

} // namespace readyq::iocp

#endif
