#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config_parser.h"
#include "pipeline_types.h"

// Concrete encoder plus its rate-control arguments for one source codec
struct EncoderChoice
{
    std::string encoder;
    RateControl rateControl = RateControl::BitrateCapped;
    std::vector<std::string> qualityArgs;
};

// One acceleration backend: which encoders it has and how they are driven
class IEncoderFamily
{
public:
    virtual ~IEncoderFamily() = default;

    virtual AccelMode mode() const = 0;
    virtual EncoderFamilyKind kind() const = 0;

    // False when the backend has no encoder for this codec
    virtual bool supports(VideoCodec codec) const = 0;

    // Encoder for codec at the given bitrate cap. Only valid when supports(codec).
    virtual EncoderChoice select(VideoCodec codec, int64_t bitrateCap) const = 0;

    // Arguments placed before the first -i
    virtual std::vector<std::string> inputArgs() const = 0;

    // -vf chain for an optional rescale, empty when no filter is needed
    virtual std::string videoFilter(const std::optional<Resolution> &scaleTo) const = 0;
};

// AMD/Intel VAAPI: h264_vaapi, hevc_vaapi, av1_vaapi
class VaapiEncoderFamily : public IEncoderFamily
{
public:
    VaapiEncoderFamily(const QualitySettings &quality, std::string device);

    AccelMode mode() const override { return AccelMode::Vaapi; }
    EncoderFamilyKind kind() const override { return EncoderFamilyKind::Hardware; }
    bool supports(VideoCodec codec) const override;
    EncoderChoice select(VideoCodec codec, int64_t bitrateCap) const override;
    std::vector<std::string> inputArgs() const override;
    std::string videoFilter(const std::optional<Resolution> &scaleTo) const override;

private:
    QualitySettings m_quality;
    std::string m_device;
};

// Rockchip MPP: h264_rkmpp, hevc_rkmpp. AV1 is decode-only on this hardware.
class RkmppEncoderFamily : public IEncoderFamily
{
public:
    explicit RkmppEncoderFamily(const QualitySettings &quality);

    AccelMode mode() const override { return AccelMode::Rkmpp; }
    EncoderFamilyKind kind() const override { return EncoderFamilyKind::Hardware; }
    bool supports(VideoCodec codec) const override;
    EncoderChoice select(VideoCodec codec, int64_t bitrateCap) const override;
    std::vector<std::string> inputArgs() const override;
    std::string videoFilter(const std::optional<Resolution> &scaleTo) const override;

private:
    QualitySettings m_quality;
};

// libx264 / libx265 / libaom-av1
class SoftwareEncoderFamily : public IEncoderFamily
{
public:
    explicit SoftwareEncoderFamily(const QualitySettings &quality);

    AccelMode mode() const override { return AccelMode::Software; }
    EncoderFamilyKind kind() const override { return EncoderFamilyKind::Software; }
    bool supports(VideoCodec) const override { return true; }
    EncoderChoice select(VideoCodec codec, int64_t bitrateCap) const override;
    std::vector<std::string> inputArgs() const override { return {}; }
    std::string videoFilter(const std::optional<Resolution> &scaleTo) const override;

private:
    QualitySettings m_quality;
};

std::unique_ptr<IEncoderFamily> create_encoder_family(AccelMode mode, const QualitySettings &quality,
                                                      const std::string &hardwareDevice);
