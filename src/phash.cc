#include "phash.hh"

#include <array>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include "config.hh"
#include "digest.hh"
#include "log.hh"

namespace declutter {

inline namespace detail_v1 {

namespace {

constexpr auto phash_bits = (phash_blk - 1) * phash_blk;

cv::Mat to_luminance(const cv::Mat &image) {
  cv::Mat bgr;
  switch (image.channels()) {
    case 4:
      cv::cvtColor(image, bgr, cv::COLOR_BGRA2BGR);
      break;
    case 3:
    case 1:
      bgr = image;
      break;
    default:
      CV_Error(cv::Error::StsBadArg, "unsupported channel count");
  }

  cv::Mat resized;
  cv::resize(bgr, resized, cv::Size(phash_grid, phash_grid), 0, 0,
             cv::INTER_AREA);

  cv::Mat gray;
  if (resized.channels() == 3) {
    cv::cvtColor(resized, gray, cv::COLOR_BGR2GRAY);
  } else {
    gray = resized;
  }

  cv::Mat gray_f;
  gray.convertTo(gray_f, CV_32F);
  return gray_f;
}

}  // namespace

std::string phash_of(const cv::Mat &image) {
  CV_Assert(!image.empty());

  cv::Mat coef;
  cv::dct(to_luminance(image), coef);

  // low frequency block without the DC row
  const cv::Mat roi = coef(cv::Rect(0, 1, phash_blk, phash_blk - 1));
  const auto mean_val = cv::mean(roi)[0];

  std::array<unsigned char, phash_bits / 8> packed{};
  for (auto r = 0; r < roi.rows; ++r) {
    for (auto c = 0; c < roi.cols; ++c) {
      if (roi.at<float>(r, c) > mean_val) {
        const auto idx = r * phash_blk + c;
        packed[idx / 8] |= static_cast<unsigned char>(0x80U >> (idx % 8));
      }
    }
  }
  return to_hex(packed.data(), packed.size());
}

std::optional<std::string> image_phash(const std::filesystem::path &path) {
  try {
    const cv::Mat image = cv::imread(path.string(), cv::IMREAD_UNCHANGED);
    if (image.empty()) {
      log_warn() << "decode failed: " << path;
      return std::nullopt;
    }
    return phash_of(image);
  } catch (const cv::Exception &e) {
    log_warn() << "decode failed: " << path << " - " << e.what();
    return std::nullopt;
  }
}

}  // namespace detail_v1

}  // namespace declutter
