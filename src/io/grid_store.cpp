#include <specsynth/io/grid_store.hpp>
#include <specsynth/core/error.hpp>
#include <opencv2/core.hpp>
#include <string>

namespace specsynth::io {

namespace {

constexpr const char* kDataKey = "data";
constexpr const char* kDfKey = "df_hz";
constexpr const char* kDtKey = "dt_s";
constexpr const char* kFmaxKey = "fmax_hz";

}  // namespace

std::expected<void, core::SynthError> save_grid_record(const std::string& path,
                                                       const core::GridRecord& record) {
  if (record.data.empty()) {
    return std::unexpected(core::SynthError::SaveFailed);
  }
  try {
    cv::FileStorage fs(path, cv::FileStorage::WRITE);
    if (!fs.isOpened()) {
      return std::unexpected(core::SynthError::SaveFailed);
    }
    fs << kDfKey << record.df.hz();
    fs << kDtKey << record.dt.seconds();
    fs << kFmaxKey << record.fmax.hz();
    fs << kDataKey << record.data;
    fs.release();
  } catch (const cv::Exception&) {
    return std::unexpected(core::SynthError::SaveFailed);
  }
  return {};
}

std::expected<core::GridRecord, core::SynthError> load_grid_record(const std::string& path) {
  core::GridRecord record;
  try {
    cv::FileStorage fs(path, cv::FileStorage::READ);
    if (!fs.isOpened()) {
      return std::unexpected(core::SynthError::LoadFailed);
    }
    const cv::FileNode df = fs[kDfKey];
    const cv::FileNode dt = fs[kDtKey];
    const cv::FileNode fmax = fs[kFmaxKey];
    if (df.empty() || dt.empty() || fmax.empty()) {
      return std::unexpected(core::SynthError::LoadFailed);
    }
    record.df = static_cast<double>(df);
    record.dt = static_cast<double>(dt);
    record.fmax = static_cast<double>(fmax);
    fs[kDataKey] >> record.data;
  } catch (const cv::Exception&) {
    return std::unexpected(core::SynthError::LoadFailed);
  }
  if (record.data.empty()) {
    return std::unexpected(core::SynthError::LoadFailed);
  }
  return record;
}

}  // namespace specsynth::io
