// tests/test_layer2_service/workers/logger_workers.h
#pragma once

namespace federator::tests::worker::logger
{

int test_basic_logging(const char *log_path);
int test_log_level_filtering(const char *log_path);
int test_flush_waits_for_queue(const char *log_path);
int test_multithread_logging(const char *log_path);
int test_set_logfile_failure_keeps_sink(const char *log_path);
int test_shutdown_idempotency(const char *log_path);

} // namespace federator::tests::worker::logger
