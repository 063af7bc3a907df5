#include "errors.h"

#include "common.h"

namespace readyq::iocp {

IoStatus classifyStatus(NTSTATUS status) {
	switch (status) {
	case STATUS_SUCCESS:
		return IoStatus::Success;
	case STATUS_PENDING:
		return IoStatus::Pending;
	case STATUS_CANCELLED:
		return IoStatus::Cancelled;
	case STATUS_NOT_FOUND:
		return IoStatus::NotFound;
	default:
		return IoStatus::Failed;
	}
}

IoStatus classifyWinError(DWORD error) {
	switch (error) {
	case ERROR_SUCCESS:
		return IoStatus::Success;
	case ERROR_IO_PENDING:
		return IoStatus::Pending;
	case ERROR_OPERATION_ABORTED:
		return IoStatus::Cancelled;
	case ERROR_NOT_FOUND:
		return IoStatus::NotFound;
	default:
		return IoStatus::Failed;
	}
}

DWORD winErrorFromNtStatus(NTSTATUS status) {
	switch (status) {
	case STATUS_SUCCESS:
		return ERROR_SUCCESS;
	case STATUS_PENDING:
		return ERROR_IO_PENDING;
	case STATUS_CANCELLED:
		return ERROR_OPERATION_ABORTED;
	case STATUS_NOT_FOUND:
		return ERROR_NOT_FOUND;
	case STATUS_INVALID_HANDLE:
		return ERROR_INVALID_HANDLE;
	case STATUS_PIPE_BROKEN:
		return ERROR_BROKEN_PIPE;
	default:
		DEBUG_LOG("readyq(iocp): unhandled NTSTATUS 0x%08x\n", static_cast<unsigned int>(status));
		return ERROR_MR_MID_NOT_FOUND;
	}
}

NTSTATUS statusFromWinError(DWORD error) {
	switch (error) {
	case ERROR_SUCCESS:
		return STATUS_SUCCESS;
	case ERROR_IO_PENDING:
		return STATUS_PENDING;
	case ERROR_OPERATION_ABORTED:
		return STATUS_CANCELLED;
	case ERROR_NOT_FOUND:
		return STATUS_NOT_FOUND;
	case ERROR_INVALID_HANDLE:
		return STATUS_INVALID_HANDLE;
	case ERROR_BROKEN_PIPE:
		return STATUS_PIPE_BROKEN;
	default:
		return STATUS_UNEXPECTED_IO_ERROR;
	}
}

const char *ioStatusName(IoStatus status) {
	switch (status) {
	case IoStatus::Success:
		return "success";
	case IoStatus::Pending:
		return "pending";
	case IoStatus::Cancelled:
		return "cancelled";
	case IoStatus::NotFound:
		return "not-found";
	case IoStatus::Failed:
		return "failed";
	}
	return "unknown";
}

} // namespace readyq::iocp
