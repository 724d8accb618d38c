/*
 * Part of the Zikzi project.
 *
 * SPDX-FileCopyrightText: 2025 Zikzi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Zikzi. See LICENSE for details.
 */

#include <gtest/gtest.h>
#include <cctype>
#include <string>
#include <unordered_set>
#include "zikzi/types.hpp"
#include "zikzi/internal/memory_store.hpp"
#include "zikzi/internal/utils.hpp"
#include "test_support.hpp"

using namespace zikzi;

TEST(JobState, AllowedTransitions) {
    EXPECT_TRUE(can_advance(JobStatus::Received, JobStatus::Processing));
    EXPECT_TRUE(can_advance(JobStatus::Processing, JobStatus::Completed));
    EXPECT_TRUE(can_advance(JobStatus::Processing, JobStatus::Failed));

    EXPECT_FALSE(can_advance(JobStatus::Received, JobStatus::Completed));
    EXPECT_FALSE(can_advance(JobStatus::Received, JobStatus::Failed));
    EXPECT_FALSE(can_advance(JobStatus::Processing, JobStatus::Received));
    EXPECT_FALSE(can_advance(JobStatus::Completed, JobStatus::Failed));
    EXPECT_FALSE(can_advance(JobStatus::Failed, JobStatus::Processing));
    EXPECT_FALSE(can_advance(JobStatus::Processing, JobStatus::Processing));
}

TEST(JobState, AdvanceLeavesJobOnIllegalMove) {
    PrintJob j;
    EXPECT_FALSE(advance(j, JobStatus::Completed));
    EXPECT_EQ(j.status, JobStatus::Received);
    EXPECT_TRUE(advance(j, JobStatus::Processing));
    EXPECT_TRUE(advance(j, JobStatus::Failed));
    EXPECT_TRUE(is_terminal(j.status));
    EXPECT_FALSE(advance(j, JobStatus::Completed));
}

TEST(JobState, NamesAndIppMapping) {
    JobStatus s = JobStatus::Received;
    EXPECT_TRUE(parse_job_status("completed", s));
    EXPECT_EQ(s, JobStatus::Completed);
    EXPECT_FALSE(parse_job_status("printing", s));
    EXPECT_STREQ(to_string(JobStatus::Processing), "processing");

    EXPECT_EQ(ipp_job_state(JobStatus::Received), 3);
    EXPECT_EQ(ipp_job_state(JobStatus::Processing), 5);
    EXPECT_EQ(ipp_job_state(JobStatus::Failed), 8);
    EXPECT_EQ(ipp_job_state(JobStatus::Completed), 9);
    EXPECT_STREQ(ipp_job_state_reason(JobStatus::Processing), "job-printing");
}

TEST(ShortId, BurstsNeverCollide) {
    std::unordered_set<std::string> seen;
    for (int i = 0; i < 20000; ++i) {
        const std::string id = zikzi::internal::generate_short_id();
        ASSERT_EQ(id.size(), 12u);
        for (char ch : id) ASSERT_TRUE(std::isalnum(static_cast<unsigned char>(ch))) << id;
        ASSERT_TRUE(seen.insert(id).second) << "duplicate " << id;
    }
}

TEST(MemoryStoreJobs, BurstOfCreatesAllStored) {
    zikzi::internal::MemoryStore store;
    for (int i = 0; i < 5000; ++i) {
        zikzi::PrintJob j;
        ASSERT_TRUE(store.create_job(j)) << i;
    }
    EXPECT_EQ(store.job_count(), 5000u);
}

TEST(MemoryStoreJobs, SaveEnforcesStateMachine) {
    internal::MemoryStore st;
    PrintJob j;
    j.source_ip = "10.0.0.5";
    ASSERT_TRUE(st.create_job(j));
    EXPECT_EQ(j.id.size(), 12u);
    EXPECT_GT(j.created_at_ms, 0);
    EXPECT_EQ(st.queued_job_count(), 1u);

    PrintJob skip = j;
    skip.status = JobStatus::Completed;
    EXPECT_FALSE(st.save_job(skip));

    ASSERT_TRUE(advance(j, JobStatus::Processing));
    EXPECT_TRUE(st.save_job(j));
    EXPECT_TRUE(st.save_job(j));   // same status, other fields may change

    PrintJob back = j;
    back.status = JobStatus::Received;
    EXPECT_FALSE(st.save_job(back));

    ASSERT_TRUE(advance(j, JobStatus::Completed));
    EXPECT_TRUE(st.save_job(j));
    EXPECT_EQ(st.queued_job_count(), 0u);

    j.document_name = "changed";
    EXPECT_FALSE(st.save_job(j));
    PrintJob stored;
    ASSERT_TRUE(st.find_job(j.id, stored));
    EXPECT_TRUE(stored.document_name.empty());
}

TEST(MemoryStoreJobs, RecentJobsNewestFirstPerUser) {
    internal::MemoryStore st;
    std::vector<std::string> ids;
    for (int i = 0; i < 4; ++i) {
        PrintJob j;
        j.user_id = (i % 2 == 0) ? "u1" : "u2";
        ASSERT_TRUE(st.create_job(j));
        ids.push_back(j.id);
    }
    auto all = st.recent_jobs("", 10);
    ASSERT_EQ(all.size(), 4u);
    EXPECT_EQ(all[0].id, ids[3]);
    EXPECT_EQ(all[3].id, ids[0]);

    auto u1 = st.recent_jobs("u1", 10);
    ASSERT_EQ(u1.size(), 2u);
    EXPECT_EQ(u1[0].id, ids[2]);

    EXPECT_EQ(st.recent_jobs("", 1).size(), 1u);
}

TEST(MemoryStoreSeed, LoadsAllOrNothing) {
    test::TempDir dir;
    const std::string good = dir.path() + "/good.txt";
    test::write_file(good,
        "# users\n"
        "user u1 alice - - 1\n"
        "token t1 u1 tok-secret 1\n"
        "token t2 u1 old 1 1000\n"
        "ip 10.0.0.5 u1 1\n");
    internal::MemoryStore st;
    ASSERT_TRUE(st.load_file(good));
    User u;
    ASSERT_TRUE(st.find_user_by_name("alice", u));
    EXPECT_TRUE(u.password_hash.empty());
    EXPECT_EQ(st.active_tokens("u1").size(), 2u);
    IPRegistration r;
    EXPECT_TRUE(st.find_ip_registration("10.0.0.5", 2000, r));

    const std::string bad = dir.path() + "/bad.txt";
    test::write_file(bad, "user u9 mallory - - 1\nip 10.0.0.9 u9 maybe\n");
    internal::MemoryStore st2;
    EXPECT_FALSE(st2.load_file(bad));
    EXPECT_FALSE(st2.find_user_by_name("mallory", u));
    EXPECT_FALSE(st2.load_file(dir.path() + "/missing.txt"));
}
