#include "encoder_family.h"

#include <utility>

namespace
{
    std::vector<std::string> bitrate_args(int64_t bitrate)
    {
        return {"-b:v:0", std::to_string(bitrate)};
    }

    std::string plain_scale_filter(const std::optional<Resolution> &scaleTo)
    {
        if (!scaleTo)
            return {};
        return "scale=" + std::to_string(scaleTo->width) + ":" + std::to_string(scaleTo->height);
    }

    int quality_for(const QualitySettings &quality, VideoCodec codec)
    {
        switch (codec)
        {
        case VideoCodec::H264:
            return quality.h264;
        case VideoCodec::Av1:
            return quality.av1;
        default:
            return quality.hevc;
        }
    }
}

VaapiEncoderFamily::VaapiEncoderFamily(const QualitySettings &quality, std::string device)
    : m_quality(quality), m_device(std::move(device))
{
}

bool VaapiEncoderFamily::supports(VideoCodec) const
{
    return true;
}

EncoderChoice VaapiEncoderFamily::select(VideoCodec codec, int64_t bitrateCap) const
{
    EncoderChoice choice;
    switch (codec)
    {
    case VideoCodec::H264:
        choice.encoder = "h264_vaapi";
        break;
    case VideoCodec::Av1:
        choice.encoder = "av1_vaapi";
        break;
    default:
        choice.encoder = "hevc_vaapi";
        break;
    }

    if (m_quality.mode == QualityMode::Quality && codec != VideoCodec::Av1)
    {
        choice.rateControl = RateControl::ConstantQuality;
        choice.qualityArgs = {"-rc_mode", "CQP", "-qp", std::to_string(quality_for(m_quality, codec))};
    }
    else
    {
        choice.rateControl = RateControl::BitrateCapped;
        choice.qualityArgs = bitrate_args(bitrateCap);
    }
    return choice;
}

std::vector<std::string> VaapiEncoderFamily::inputArgs() const
{
    return {"-hwaccel", "vaapi", "-vaapi_device", m_device};
}

std::string VaapiEncoderFamily::videoFilter(const std::optional<Resolution> &scaleTo) const
{
    std::string vf = "format=nv12,hwupload";
    if (scaleTo)
        vf += ",scale_vaapi=w=" + std::to_string(scaleTo->width) + ":h=" + std::to_string(scaleTo->height);
    return vf;
}

RkmppEncoderFamily::RkmppEncoderFamily(const QualitySettings &quality)
    : m_quality(quality)
{
}

bool RkmppEncoderFamily::supports(VideoCodec codec) const
{
    return codec != VideoCodec::Av1;
}

EncoderChoice RkmppEncoderFamily::select(VideoCodec codec, int64_t bitrateCap) const
{
    EncoderChoice choice;
    choice.encoder = codec == VideoCodec::H264 ? "h264_rkmpp" : "hevc_rkmpp";

    if (m_quality.mode == QualityMode::Quality)
    {
        choice.rateControl = RateControl::ConstantQuality;
        choice.qualityArgs = {"-rc_mode", "CQP", "-qp_init", std::to_string(quality_for(m_quality, codec))};
    }
    else
    {
        choice.rateControl = RateControl::BitrateCapped;
        choice.qualityArgs = bitrate_args(bitrateCap);
    }
    return choice;
}

std::vector<std::string> RkmppEncoderFamily::inputArgs() const
{
    return {"-hwaccel", "rkmpp"};
}

std::string RkmppEncoderFamily::videoFilter(const std::optional<Resolution> &scaleTo) const
{
    return plain_scale_filter(scaleTo);
}

SoftwareEncoderFamily::SoftwareEncoderFamily(const QualitySettings &quality)
    : m_quality(quality)
{
}

EncoderChoice SoftwareEncoderFamily::select(VideoCodec codec, int64_t bitrateCap) const
{
    EncoderChoice choice;
    if (codec == VideoCodec::Av1)
    {
        // libaom is always driven in constant-quality mode
        choice.encoder = "libaom-av1";
        choice.rateControl = RateControl::ConstantQuality;
        choice.qualityArgs = {"-crf", std::to_string(m_quality.av1), "-b:v", "0", "-cpu-used", "4"};
        return choice;
    }

    choice.encoder = codec == VideoCodec::H264 ? "libx264" : "libx265";
    if (m_quality.mode == QualityMode::Quality)
    {
        const std::string cap = std::to_string(bitrateCap);
        choice.rateControl = RateControl::ConstantQuality;
        choice.qualityArgs = {"-crf", std::to_string(quality_for(m_quality, codec)),
                              "-maxrate", cap,
                              "-bufsize", std::to_string(bitrateCap * 2),
                              "-preset", m_quality.softwarePreset};
    }
    else
    {
        choice.rateControl = RateControl::BitrateCapped;
        choice.qualityArgs = bitrate_args(bitrateCap);
        choice.qualityArgs.push_back("-preset");
        choice.qualityArgs.push_back(m_quality.softwarePreset);
    }
    return choice;
}

std::string SoftwareEncoderFamily::videoFilter(const std::optional<Resolution> &scaleTo) const
{
    return plain_scale_filter(scaleTo);
}

std::unique_ptr<IEncoderFamily> create_encoder_family(AccelMode mode, const QualitySettings &quality,
                                                      const std::string &hardwareDevice)
{
    switch (mode)
    {
    case AccelMode::Vaapi:
        return std::make_unique<VaapiEncoderFamily>(quality, hardwareDevice);
    case AccelMode::Rkmpp:
        return std::make_unique<RkmppEncoderFamily>(quality);
    default:
        return std::make_unique<SoftwareEncoderFamily>(quality);
    }
}
