#ifndef USB_TEST_H
#define USB_TEST_H

#include <cstdlib>
#include <vector>

#include <spdlog/spdlog.h>

#include <LogicPublicTypes.h>

#define ASSERT( _arg )                                                                                                         \
    do                                                                                                                         \
    {                                                                                                                          \
        if( !( _arg ) )                                                                                                        \
        {                                                                                                                      \
            spdlog::error( "ASSERT failed: {} at {}:{}", #_arg, __FILE__, __LINE__ );                                           \
            exit( 1 );                                                                                                         \
        }                                                                                                                      \
    } while( 0 )

// builds a byte vector from a literal array
template <size_t N>
inline std::vector<U8> Bytes( const U8 ( &data )[ N ] )
{
    return std::vector<U8>( data, data + N );
}

// primitives
void test_reader();
void test_writer();
void test_version();
void test_bitmap_strings();
void test_bitmap_controls();
void test_string_ref();

// standard stream
void test_decode_entry_conditions();
void test_interface_association();
void test_security();
void test_encryption();
void test_string_descriptor();
void test_ss_companion();
void test_hid_report_envelope();
void test_marker_and_unknown();
void test_standard_round_trip();

// class context
void test_generic_descriptor();
void test_hid_descriptor();
void test_ccid_descriptor();
void test_printer_descriptor();
void test_cdc_descriptor();
void test_video_descriptor();
void test_context_fallback();

// audio control
void test_uac_protocol();
void test_uac_interface_remap();
void test_uac_kind_selection();
void test_uac1_control();
void test_uac1_mixer_truncated();
void test_uac2_control();
void test_uac3_control();
void test_uac_envelope();
void test_uac_processing_units();

// audio streaming
void test_uac_streaming_interface();
void test_uac_format_type();
void test_uac_format_specific();
void test_uac_streaming_endpoint();
void test_uac_channel_names();

// MIDI
void test_midi_entities();
void test_midi_descriptor_strings();
void test_midi_endpoint();

// configuration walker
void test_parser_walk();
void test_parser_audio_function();
void test_parser_stops();
void test_string_table();

// dump
void test_dump_configuration();
void test_dump_warnings();
void test_dump_audio();

// settings
void test_settings_defaults();
void test_settings_validate();
void test_settings_archive();

#endif // USB_TEST_H
