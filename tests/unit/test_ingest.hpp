#pragma once

namespace payengine::tests {

void test_split_record();
void test_decode_rows();
void test_decode_invalid_rows();
void test_header_errors();

}  // namespace payengine::tests
