#pragma once

namespace AppConstants {
    inline constexpr const char* AppName = "PhotoReel";
    inline constexpr const char* AppVersion = "0.1.0";
    inline constexpr const char* OrgName = "PhotoReel";

    // Output video format (not user configurable)
    inline constexpr int VideoWidth = 1280;
    inline constexpr int VideoHeight = 720;
    inline constexpr int FrameRate = 30;

    inline constexpr int MinDurationSeconds = 5;
    inline constexpr int MaxDurationSeconds = 20;
    inline constexpr int DefaultDurationSeconds = 8;

    inline constexpr const char* DefaultAccentColor = "#ff7b7b";
    inline constexpr const char* DefaultOutputName = "movie-from-photo.mp4";

    // Caption overlay proportions, relative to the output frame
    inline constexpr double CaptionFontRatio = 0.065;
    inline constexpr double CaptionLineHeightRatio = 1.35;
    inline constexpr double CaptionMaxWidthRatio = 0.75;
    inline constexpr double CaptionPanelPaddingRatio = 0.9;  // of font size
    inline constexpr int CaptionPanelSideMargin = 48;
    inline constexpr int CaptionPanelBottomMargin = 48;

    // Staged artifact names inside the encoder working directory
    inline constexpr const char* FrameArtifact = "frame.png";
    inline constexpr const char* OutputArtifact = "output.mp4";
    inline constexpr const char* DefaultAudioArtifact = "audio.mp3";
}
