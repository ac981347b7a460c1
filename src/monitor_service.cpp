// Repository: encodewatch
// Component: EncodeMonitor gRPC Service Implementation
// Purpose: Serves progress snapshots and stop requests for one encode session.
// Copyright (c) 2025 encodewatch

#include "monitor_service.h"

#include <string>
#include <utility>

#include "encodewatch/progress/DisplayFormat.h"
#include "encodewatch/util/Logger.h"

namespace encodewatch
{
  namespace monitor
  {

    namespace
    {
      constexpr char kApiVersion[] = "1.0.0";

      void FillReport(const progress::SessionState &state, bool include_log,
                      ProgressReport *response)
      {
        const progress::ProgressSnapshot &p = state.progress;
        response->set_current_frame(p.current_frame);
        response->set_current_fps(p.current_fps);
        response->set_last_valid_fps(p.last_valid_fps);
        response->set_bitrate(p.bitrate.raw);
        response->set_bitrate_available(p.bitrate.available);
        response->set_speed(p.speed.raw);
        response->set_speed_available(p.speed.available);
        response->set_speed_value(p.speed.value);
        response->set_last_valid_speed(p.last_valid_speed);
        response->set_total_output_bytes(p.total_output_bytes);
        response->set_elapsed_media_us(p.elapsed_media_us);
        response->set_completion_percent(p.completion_percent);
        response->set_percent_known(p.PercentKnown());
        response->set_total_frames(p.total_frames);
        response->set_frame_count_estimated(p.frame_count_estimated);
        response->set_total_duration_us(p.total_duration_us);
        response->set_source_fps(p.source_fps);
        response->set_source_fps_is_fallback(p.source_fps_is_fallback);
        response->set_eta_us(p.eta_available ? p.eta_us : progress::kEtaUnavailableUs);
        response->set_eta_available(p.eta_available);
        response->set_run_start_utc_us(p.run_start_utc_us);
        response->set_done(state.done);
        response->set_error(state.error);
        response->set_status_line(progress::FormatStatusLine(state));

        if (include_log)
        {
          for (const auto &line : state.log)
          {
            response->add_log(line);
          }
        }
      }
    } // namespace

    EncodeMonitorImpl::EncodeMonitorImpl(std::shared_ptr<encode::EncodeSession> session)
        : session_(std::move(session))
    {
      util::Logger::Info(std::string("[EncodeMonitorImpl] Service initialized (API version: ") +
                         kApiVersion + ")");
    }

    EncodeMonitorImpl::~EncodeMonitorImpl()
    {
      util::Logger::Info("[EncodeMonitorImpl] Service shutting down");
    }

    grpc::Status EncodeMonitorImpl::GetProgress(grpc::ServerContext *context,
                                                const ProgressRequest *request,
                                                ProgressReport *response)
    {
      if (!session_)
      {
        return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, "no encode session");
      }

      FillReport(session_->GetState(), request->include_log(), response);
      response->set_input_path(session_->input_path());
      response->set_output_path(session_->output_path());
      return grpc::Status::OK;
    }

    grpc::Status EncodeMonitorImpl::StopEncode(grpc::ServerContext *context,
                                               const StopEncodeRequest *request,
                                               StopEncodeResponse *response)
    {
      util::Logger::Info("[StopEncode] Request received");

      if (!session_)
      {
        return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, "no encode session");
      }

      if (session_->GetState().done)
      {
        response->set_accepted(false);
        response->set_message("Encode already finished");
        return grpc::Status::OK;
      }

      if (!session_->Stop())
      {
        response->set_accepted(false);
        response->set_message("Encoder is not running");
        return grpc::Status::OK;
      }

      response->set_accepted(true);
      response->set_message("Encoder stopped");
      return grpc::Status::OK;
    }

    grpc::Status EncodeMonitorImpl::GetVersion(grpc::ServerContext *context,
                                               const ApiVersionRequest *request,
                                               ApiVersion *response)
    {
      util::Logger::Debug("[GetVersion] Request received");
      response->set_version(kApiVersion);
      return grpc::Status::OK;
    }

  } // namespace monitor
} // namespace encodewatch
