#include "audio_input.hpp"

#include <cerrno>

namespace waterfall {

AcquisitionError classify_acquisition_error(int err) {
    if (err >= 0) return AcquisitionError::None;
    switch (-err) {
        case EACCES:
        case EPERM:
            return AcquisitionError::AcquisitionDenied;
        case ENOENT:
        case ENODEV:
        case ENXIO:
            return AcquisitionError::DeviceUnavailable;
        case EBUSY:
        case EAGAIN:
            return AcquisitionError::DeviceBusy;
        default:
            return AcquisitionError::Failed;
    }
}

const char* acquisition_error_name(AcquisitionError e) {
    switch (e) {
        case AcquisitionError::None: return "none";
        case AcquisitionError::AcquisitionDenied: return "acquisition denied";
        case AcquisitionError::DeviceUnavailable: return "device unavailable";
        case AcquisitionError::DeviceBusy: return "device busy";
        case AcquisitionError::Failed: return "failed";
    }
    return "failed";
}

const char* describe_acquisition_error(AcquisitionError e) {
    switch (e) {
        case AcquisitionError::None:
            return "";
        case AcquisitionError::AcquisitionDenied:
            return "Access to the capture device was refused. Check permissions (audio group) and press Start to retry.";
        case AcquisitionError::DeviceUnavailable:
            return "No capture device was found or the selected device is unavailable. Choose a different input and press Start again.";
        case AcquisitionError::DeviceBusy:
            return "The capture device is in use by another application. Close it and press Start to retry.";
        case AcquisitionError::Failed:
            break;
    }
    return "An error occurred while opening the capture device. Press Start to retry.";
}

} // namespace waterfall
