// Interleaved stereo WAV writer on top of libsndfile, for fm-render

#ifndef PMSYNTH_HOST_WAV_FILE_H_
#define PMSYNTH_HOST_WAV_FILE_H_

#include <sndfile.h>
#include <cstdint>
#include <cstdio>
#include <string>

namespace host {

class WavFile {
 public:
  enum SampleFormat {
    FORMAT_FLOAT32 = 0,
    FORMAT_PCM16
  };

  WavFile() : file_(nullptr), frames_written_(0) {}
  ~WavFile() {
    if (file_ && !Close()) {
      fprintf(stderr, "[Wav] %s may be truncated\n", path_.c_str());
    }
  }

  // title is stored in the file's INFO chunk; may be empty
  bool Create(const std::string& path, int sample_rate, int channels,
              SampleFormat format, const std::string& title) {
    if (file_ && !Close()) {
      return false;
    }
    SF_INFO info = {};
    info.samplerate = sample_rate;
    info.channels = channels;
    info.format = SF_FORMAT_WAV |
                  (format == FORMAT_PCM16 ? SF_FORMAT_PCM_16 : SF_FORMAT_FLOAT);
    if (!sf_format_check(&info)) {
      fprintf(stderr, "[Wav] Unsupported format: %d Hz, %d channels\n",
              sample_rate, channels);
      return false;
    }
    file_ = sf_open(path.c_str(), SFM_WRITE, &info);
    if (!file_) {
      fprintf(stderr, "[Wav] Cannot create %s: %s\n", path.c_str(), sf_strerror(nullptr));
      return false;
    }
    path_ = path;
    frames_written_ = 0;

    // Metadata failures leave the audio intact; report and carry on
    if (sf_set_string(file_, SF_STR_SOFTWARE, "pmsynth fm-render") != 0 ||
        (!title.empty() && sf_set_string(file_, SF_STR_TITLE, title.c_str()) != 0)) {
      fprintf(stderr, "[Wav] warning: cannot tag %s: %s\n", path.c_str(), sf_strerror(file_));
    }
    return true;
  }

  // Returns frames written; fewer than asked means a write error
  sf_count_t Append(const float* frames, sf_count_t count) {
    return Track(file_ ? sf_writef_float(file_, frames, count) : 0, count);
  }

  sf_count_t Append(const int16_t* frames, sf_count_t count) {
    return Track(file_ ? sf_writef_short(file_, frames, count) : 0, count);
  }

  // Flushes the header; false if the file could not be finalized
  bool Close() {
    if (!file_) {
      return true;
    }
    const int err = sf_close(file_);
    file_ = nullptr;
    if (err != SF_ERR_NO_ERROR) {
      fprintf(stderr, "[Wav] Cannot finalize %s: %s\n", path_.c_str(), sf_error_number(err));
      return false;
    }
    return true;
  }

  sf_count_t frames_written() const { return frames_written_; }

 private:
  SNDFILE* file_;
  std::string path_;
  sf_count_t frames_written_;

  sf_count_t Track(sf_count_t written, sf_count_t wanted) {
    frames_written_ += written;
    if (written != wanted && file_) {
      fprintf(stderr, "[Wav] Write to %s failed: %s\n", path_.c_str(), sf_strerror(file_));
    }
    return written;
  }

  WavFile(const WavFile&) = delete;
  WavFile& operator=(const WavFile&) = delete;
};

}  // namespace host

#endif  // PMSYNTH_HOST_WAV_FILE_H_
