#include <boost/test/unit_test.hpp>  // NOTE: not the "included/" runner here
#include <xorec/codec/errors.h>
#include <xorec/codec/fragment.h>
#include <xorec/codec/metadata.h>
#include <xorec/codec/part_codec.h>
#include <xorec/codec/file_codec.h>
#include <xorec/fec_core/chunk_splitter.h>
#include <xorec/fec_core/xor_parity.h>
#include <xorec/metrics/overhead.h>
#include <xorec/metrics/run_report.h>
#include <xorec/metrics/schema.h>
#include <xorec/sim/rng.h>
#include <xorec/sim/selection.h>
#include <xorec/storage/file_io.h>
#include <xorec/storage/fragment_store.h>
#include <xorec/storage/metadata_json.h>
#include <xorec/util/sha256.h>
#include <xorec/util/uuid.h>

BOOST_AUTO_TEST_CASE(headers_compile) {
    BOOST_TEST(xorec::metrics::schema_version == 2);
}
