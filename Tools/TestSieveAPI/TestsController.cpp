/*
 * Copyright (C) 2026 The Sieve Authors. All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions
 * are met:
 * 1. Redistributions of source code must retain the above copyright
 *    notice, this list of conditions and the following disclaimer.
 * 2. Redistributions in binary form must reproduce the above copyright
 *    notice, this list of conditions and the following disclaimer in the
 *    documentation and/or other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE SIEVE AUTHORS AND CONTRIBUTORS ``AS IS''
 * AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO,
 * THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR
 * PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE SIEVE AUTHORS OR CONTRIBUTORS
 * BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
 * CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
 * SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
 * INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
 * CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
 * ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF
 * THE POSSIBILITY OF SUCH DAMAGE.
 */

#include "config.h"
#include "TestsController.h"

#include <cstdio>
#include <gtest/gtest.h>
#include <support/Logging.h>

namespace TestSieveAPI {

TestsController& TestsController::shared()
{
    static TestsController& shared = *new TestsController;
    return shared;
}

void TestsController::initialize(int& argc, char** argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    Sieve::initializeLogChannelsIfNecessary();
}

void TestsController::dumpTestNames()
{
    ::testing::UnitTest* unitTest = ::testing::UnitTest::GetInstance();

    for (int i = 0; i < unitTest->total_test_suite_count(); i++) {
        const ::testing::TestSuite* testSuite = unitTest->GetTestSuite(i);
        for (int j = 0; j < testSuite->total_test_count(); j++) {
            const ::testing::TestInfo* testInfo = testSuite->GetTestInfo(j);
            printf("%s.%s\n", testSuite->name(), testInfo->name());
        }
    }
}

bool TestsController::runAllTests()
{
    return !RUN_ALL_TESTS();
}

} // namespace TestSieveAPI
