#pragma once

#include "cce_audio_mixer.h"
#include "cce_errors.h"
#include "cce_key_color.h"
#include "cce_logo_overlay.h"
#include "cce_time.h"
#include "cce_timing_gate.h"
#include <optional>
#include <string>

namespace cce {

// Raw, unvalidated job request. Times are in seconds.
struct JobSpec {
    std::string foreground_path;
    std::string background_path;
    std::string output_path;

    double start_time = 0.0;
    std::optional<double> end_time;

    int position_x = 0;
    int position_y = 0;
    double scale = 1.0;
    double opacity = 1.0;

    KeyColorSpec key_color = KeyColorSpec::Green();
    int edge_blur_radius = 5;
    double spill_reduction_strength = 0.0;

    AudioMode audio_mode = AudioMode::Synced;
    std::optional<LogoSpec> logo;

    bool fast_mode = true;
    bool gpu_accel = false;
};

// Validated, immutable configuration for one run
class JobParameters {
public:
    // Validate every field. Returns InvalidParameter with Error::field set
    // to the offending field name.
    static Result<JobParameters> Create(const JobSpec& spec);

    const std::string& foreground_path() const { return m_spec.foreground_path; }
    const std::string& background_path() const { return m_spec.background_path; }
    const std::string& output_path() const { return m_spec.output_path; }

    TimeUS start_us() const { return m_start_us; }
    std::optional<TimeUS> end_us() const { return m_end_us; }
    TimingGate timing_gate() const { return TimingGate(m_start_us, m_end_us); }

    int position_x() const { return m_spec.position_x; }
    int position_y() const { return m_spec.position_y; }
    double scale() const { return m_spec.scale; }
    double opacity() const { return m_spec.opacity; }

    const KeyColorSpec& key_color() const { return m_spec.key_color; }
    int edge_blur_radius() const { return m_spec.edge_blur_radius; }
    double spill_reduction_strength() const { return m_spec.spill_reduction_strength; }

    AudioMode audio_mode() const { return m_spec.audio_mode; }
    const std::optional<LogoSpec>& logo() const { return m_spec.logo; }

    bool fast_mode() const { return m_spec.fast_mode; }
    bool gpu_accel() const { return m_spec.gpu_accel; }

    const JobSpec& spec() const { return m_spec; }

private:
    JobParameters(JobSpec spec, TimeUS start_us, std::optional<TimeUS> end_us);

    JobSpec m_spec;
    TimeUS m_start_us;
    std::optional<TimeUS> m_end_us;
};

} // namespace cce
