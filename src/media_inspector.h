#pragma once

#include <optional>
#include <string>

#include "pipeline_types.h"

// Read-only view of a media file's streams and timing
class IMediaInspector
{
public:
    virtual ~IMediaInspector() = default;

    // Returns std::nullopt when the file cannot be read as media.
    // Throws TransientFileError if the file disappeared.
    virtual std::optional<MediaProbe> probe(const std::string &path) = 0;
};

// Inspector backed by libavformat; one open answers every query
class FFmpegMediaInspector : public IMediaInspector
{
public:
    std::optional<MediaProbe> probe(const std::string &path) override;
};
