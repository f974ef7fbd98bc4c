#pragma once

#include <QString>

enum class PipelineError {
    None,
    EngineLoad,     // encoder engine bootstrap failed, retried on the next job
    InputMissing,   // no image supplied
    InvalidInput,   // duration out of range or malformed accent color
    ImageDecode,    // both decode strategies rejected the image
    Render,         // raster backend could not produce the frame
    Encode          // staging, invocation or output retrieval failed
};

namespace PipelineErrors {

inline const char* name(PipelineError error) {
    switch (error) {
    case PipelineError::None: return "None";
    case PipelineError::EngineLoad: return "EngineLoad";
    case PipelineError::InputMissing: return "InputMissing";
    case PipelineError::InvalidInput: return "InvalidInput";
    case PipelineError::ImageDecode: return "ImageDecode";
    case PipelineError::Render: return "Render";
    case PipelineError::Encode: return "Encode";
    }
    return "Unknown";
}

// Message shown to the user; the underlying cause is only logged.
inline QString userMessage(PipelineError error) {
    switch (error) {
    case PipelineError::None:
        return QString();
    case PipelineError::EngineLoad:
        return "Loading the video engine failed.";
    case PipelineError::InputMissing:
        return "Please choose a photo first.";
    case PipelineError::InvalidInput:
        return "The video settings are not valid.";
    case PipelineError::ImageDecode:
    case PipelineError::Render:
    case PipelineError::Encode:
        return "Creating the video failed. Please try again.";
    }
    return QString();
}

} // namespace PipelineErrors
