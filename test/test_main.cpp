#include <unity.h>

#include "log_capture.h"

void test_ascii_strips_trailing_padding();
void test_ascii_replaces_non_printable_bytes();
void test_ascii_length_mismatch_is_decode_fault();
void test_version_triplet_uses_low_three_bytes();
void test_version_rejects_single_word();
void test_scaled_unsigned_applies_rational_scale();
void test_signed_byte_lane_is_sign_magnitude();
void test_unsigned_byte_lane_keeps_high_bit();
void test_signed_word_is_twos_complement();
void test_zero_denominator_is_fault();
void test_hex_words_render_uppercase();
void test_decode_dispatches_on_register_spec();
void test_decode_rejects_inconsistent_register_spec();
void test_every_method_rejects_extra_words();
void test_decode_leaves_value_on_extra_words();
void test_ascii_reencodes_to_source_words();
void test_get_data_returns_all_fields_in_order();
void test_get_data_values_are_scaled();
void test_failed_field_is_omitted_and_counted();
void test_unknown_field_is_decode_fault();
void test_transport_failure_reason_is_carried();
void test_named_getters_read_single_fields();
void test_identity_decodes_static_registers();
void test_get_identity_converts_controller_type();
void test_topics_follow_domain_and_client();
void test_will_registered_before_connect();
void test_birth_published_before_connected();
void test_refused_connect_returns_to_disconnected();
void test_transport_connect_failure_returns_false();
void test_publish_while_disconnected_logs_one_error();
void test_publish_while_connecting_is_dropped();
void test_transport_publish_failure_logs_one_error();
void test_data_uses_configured_qos_without_retain();
void test_disconnect_publishes_offline_status();
void test_disconnect_is_idempotent();
void test_connect_twice_is_a_warning();
void test_reconnect_republishes_birth();
void test_connection_loss_waits_in_connecting();
void test_clean_disconnect_callback_is_disconnected();
void test_wait_connected_returns_once_acknowledged();
void test_wait_connected_times_out_while_connecting();
void test_scoped_connection_disconnects_on_exit();
void test_overrun_runs_next_action_immediately();
void test_start_times_stay_on_the_grid();
void test_grid_resumes_after_overrun();
void test_grid_survives_clock_wrap();
void test_stop_before_run_skips_action();
void test_probe_finds_single_responder();
void test_probe_accepts_alternate_register();
void test_probe_reports_no_device();
void test_probe_reports_multiple_devices();
void test_probe_stays_inside_range();
void test_probe_rejects_empty_range();
void test_single_ft231x_adapter_is_selected();
void test_usb_ids_match_case_insensitively();
void test_no_matching_adapter_is_configuration_fault();
void test_several_matching_adapters_is_configuration_fault();
void test_enumeration_failure_is_transport_fault();
void test_cli_defaults_apply();
void test_cli_all_options_parse();
void test_cli_missing_broker_is_usage_error();
void test_cli_port_path_is_optional();
void test_cli_rejects_out_of_range_values();
void test_cli_rejects_wildcard_in_name();
void test_cli_unknown_option_is_usage_error();
void test_cli_help();
void test_bridge_status_carries_identity();
void test_bridge_reads_identity_once();
void test_bridge_retries_incomplete_identity();
void test_bridge_publishes_sample_to_data_topic();
void test_bridge_drops_sample_when_no_field_reads();
void test_bridge_drops_sample_while_disconnected();
void test_bridge_runs_under_scheduler();

// Every test runs with logging captured, so assertions can count error lines.
void setUp() {
  log_capture::start();
}

void tearDown() {
  log_capture::stop();
}

int main(int argc, char** argv) {
  (void)argc;
  (void)argv;
  UNITY_BEGIN();
  RUN_TEST(test_ascii_strips_trailing_padding);
  RUN_TEST(test_ascii_replaces_non_printable_bytes);
  RUN_TEST(test_ascii_length_mismatch_is_decode_fault);
  RUN_TEST(test_version_triplet_uses_low_three_bytes);
  RUN_TEST(test_version_rejects_single_word);
  RUN_TEST(test_scaled_unsigned_applies_rational_scale);
  RUN_TEST(test_signed_byte_lane_is_sign_magnitude);
  RUN_TEST(test_unsigned_byte_lane_keeps_high_bit);
  RUN_TEST(test_signed_word_is_twos_complement);
  RUN_TEST(test_zero_denominator_is_fault);
  RUN_TEST(test_hex_words_render_uppercase);
  RUN_TEST(test_decode_dispatches_on_register_spec);
  RUN_TEST(test_decode_rejects_inconsistent_register_spec);
  RUN_TEST(test_every_method_rejects_extra_words);
  RUN_TEST(test_decode_leaves_value_on_extra_words);
  RUN_TEST(test_ascii_reencodes_to_source_words);
  RUN_TEST(test_get_data_returns_all_fields_in_order);
  RUN_TEST(test_get_data_values_are_scaled);
  RUN_TEST(test_failed_field_is_omitted_and_counted);
  RUN_TEST(test_unknown_field_is_decode_fault);
  RUN_TEST(test_transport_failure_reason_is_carried);
  RUN_TEST(test_named_getters_read_single_fields);
  RUN_TEST(test_identity_decodes_static_registers);
  RUN_TEST(test_get_identity_converts_controller_type);
  RUN_TEST(test_topics_follow_domain_and_client);
  RUN_TEST(test_will_registered_before_connect);
  RUN_TEST(test_birth_published_before_connected);
  RUN_TEST(test_refused_connect_returns_to_disconnected);
  RUN_TEST(test_transport_connect_failure_returns_false);
  RUN_TEST(test_publish_while_disconnected_logs_one_error);
  RUN_TEST(test_publish_while_connecting_is_dropped);
  RUN_TEST(test_transport_publish_failure_logs_one_error);
  RUN_TEST(test_data_uses_configured_qos_without_retain);
  RUN_TEST(test_disconnect_publishes_offline_status);
  RUN_TEST(test_disconnect_is_idempotent);
  RUN_TEST(test_connect_twice_is_a_warning);
  RUN_TEST(test_reconnect_republishes_birth);
  RUN_TEST(test_connection_loss_waits_in_connecting);
  RUN_TEST(test_clean_disconnect_callback_is_disconnected);
  RUN_TEST(test_wait_connected_returns_once_acknowledged);
  RUN_TEST(test_wait_connected_times_out_while_connecting);
  RUN_TEST(test_scoped_connection_disconnects_on_exit);
  RUN_TEST(test_overrun_runs_next_action_immediately);
  RUN_TEST(test_start_times_stay_on_the_grid);
  RUN_TEST(test_grid_resumes_after_overrun);
  RUN_TEST(test_grid_survives_clock_wrap);
  RUN_TEST(test_stop_before_run_skips_action);
  RUN_TEST(test_probe_finds_single_responder);
  RUN_TEST(test_probe_accepts_alternate_register);
  RUN_TEST(test_probe_reports_no_device);
  RUN_TEST(test_probe_reports_multiple_devices);
  RUN_TEST(test_probe_stays_inside_range);
  RUN_TEST(test_probe_rejects_empty_range);
  RUN_TEST(test_single_ft231x_adapter_is_selected);
  RUN_TEST(test_usb_ids_match_case_insensitively);
  RUN_TEST(test_no_matching_adapter_is_configuration_fault);
  RUN_TEST(test_several_matching_adapters_is_configuration_fault);
  RUN_TEST(test_enumeration_failure_is_transport_fault);
  RUN_TEST(test_cli_defaults_apply);
  RUN_TEST(test_cli_all_options_parse);
  RUN_TEST(test_cli_missing_broker_is_usage_error);
  RUN_TEST(test_cli_port_path_is_optional);
  RUN_TEST(test_cli_rejects_out_of_range_values);
  RUN_TEST(test_cli_rejects_wildcard_in_name);
  RUN_TEST(test_cli_unknown_option_is_usage_error);
  RUN_TEST(test_cli_help);
  RUN_TEST(test_bridge_status_carries_identity);
  RUN_TEST(test_bridge_reads_identity_once);
  RUN_TEST(test_bridge_retries_incomplete_identity);
  RUN_TEST(test_bridge_publishes_sample_to_data_topic);
  RUN_TEST(test_bridge_drops_sample_when_no_field_reads);
  RUN_TEST(test_bridge_drops_sample_while_disconnected);
  RUN_TEST(test_bridge_runs_under_scheduler);
  return UNITY_END();
}
