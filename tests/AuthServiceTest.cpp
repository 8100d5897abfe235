#include <gtest/gtest.h>

#include "application/AuthService.hpp"
#include "application/AccountService.hpp"
#include "application/PersistentLoginManager.hpp"
#include "application/hooks/AccountRoleDeletionHook.hpp"
#include "application/hooks/PasswordResetDeletionHook.hpp"
#include "application/hooks/PersistentLoginDeletionHook.hpp"
#include "adapters/secondary/CookieSessionStore.hpp"
#include "adapters/secondary/FakeMailerAdapter.hpp"
#include "adapters/secondary/OpenSslSecurityService.hpp"
#include "mocks/InMemoryAccountRepository.hpp"
#include "mocks/InMemoryAccountRoleRepository.hpp"
#include "mocks/InMemoryPasswordResetRepository.hpp"
#include "mocks/InMemoryPendingAccountRepository.hpp"
#include "mocks/InMemoryPersistentLoginRepository.hpp"
#include "mocks/InMemorySessionRepository.hpp"
#include "mocks/FakeCookieService.hpp"
#include "mocks/FakeRequestContext.hpp"

using namespace webauth;
using namespace webauth::tests::mocks;
using ports::input::AuthStatus;

// ============================================
// Полный граф одного запроса поверх in-memory хранилищ
// ============================================

class AuthServiceTest : public ::testing::Test {
protected:
    static constexpr const char* EMAIL = "user@example.com";
    static constexpr const char* PASSWORD = "password123";

    void SetUp() override {
        settings_ = std::make_shared<settings::WebAuthSettings>();
        settings_->setHashIterations(1000);
        mailerSettings_ = std::make_shared<settings::MailerSettings>();
        mailerSettings_->setBaseUrl("https://auth.example.com");

        security_ = std::make_shared<adapters::secondary::OpenSslSecurityService>(settings_);
        accounts_ = std::make_shared<InMemoryAccountRepository>();
        roles_ = std::make_shared<InMemoryAccountRoleRepository>();
        logins_ = std::make_shared<InMemoryPersistentLoginRepository>();
        pending_ = std::make_shared<InMemoryPendingAccountRepository>();
        resets_ = std::make_shared<InMemoryPasswordResetRepository>();
        sessions_ = std::make_shared<InMemorySessionRepository>();
        mailer_ = std::make_shared<adapters::secondary::FakeMailerAdapter>(mailerSettings_);
        emailSender_ = std::make_shared<application::TransactionalEmailSender>(
            mailer_, mailerSettings_, settings_);
        cookies_ = std::make_shared<FakeCookieService>();
        request_ = std::make_shared<FakeRequestContext>();

        newRequest();
    }

    void newRequest() {
        cookies_->nextRequest();

        auto store = std::make_shared<adapters::secondary::CookieSessionStore>(
            sessions_, cookies_, security_, settings_);
        auto accountService = std::make_shared<application::AccountService>(
            store, cookies_, security_, accounts_, roles_);
        auto persistentLogins = std::make_shared<application::PersistentLoginManager>(
            logins_, cookies_, security_, request_, settings_);

        std::vector<std::shared_ptr<application::hooks::IAccountDeletionHook>> hooks = {
            std::make_shared<application::hooks::AccountRoleDeletionHook>(roles_),
            std::make_shared<application::hooks::PersistentLoginDeletionHook>(persistentLogins),
            std::make_shared<application::hooks::PasswordResetDeletionHook>(resets_)
        };

        auth_ = std::make_unique<application::AuthService>(
            accountService, persistentLogins, security_, cookies_,
            accounts_, pending_, resets_, emailSender_, std::move(hooks));
    }

    domain::Account addAccount(const std::string& email = EMAIL) {
        domain::Account account(email, security_->hashPassword(PASSWORD), "User");
        accounts_->save(account);
        return account;
    }

    // Код из последнего письма: ссылка вида {base}/{page}/{code}
    std::string codeFromLastMail(const std::string& page) const {
        auto sent = mailer_->sentMessages();
        if (sent.empty()) return "";
        auto marker = page + "/";
        auto pos = sent.back().body.find(marker);
        if (pos == std::string::npos) return "";
        return sent.back().body.substr(pos + marker.size(), 64);
    }

    std::shared_ptr<settings::WebAuthSettings> settings_;
    std::shared_ptr<settings::MailerSettings> mailerSettings_;
    std::shared_ptr<adapters::secondary::OpenSslSecurityService> security_;
    std::shared_ptr<InMemoryAccountRepository> accounts_;
    std::shared_ptr<InMemoryAccountRoleRepository> roles_;
    std::shared_ptr<InMemoryPersistentLoginRepository> logins_;
    std::shared_ptr<InMemoryPendingAccountRepository> pending_;
    std::shared_ptr<InMemoryPasswordResetRepository> resets_;
    std::shared_ptr<InMemorySessionRepository> sessions_;
    std::shared_ptr<adapters::secondary::FakeMailerAdapter> mailer_;
    std::shared_ptr<application::TransactionalEmailSender> emailSender_;
    std::shared_ptr<FakeCookieService> cookies_;
    std::shared_ptr<FakeRequestContext> request_;
    std::unique_ptr<application::AuthService> auth_;
};

// ============================================
// Login / logout
// ============================================

TEST_F(AuthServiceTest, Login_Success) {
    auto account = addAccount();

    auto result = auth_->login(EMAIL, PASSWORD, false);

    EXPECT_EQ(result.status, AuthStatus::Ok);
    EXPECT_EQ(result.message, "Login successful.");
    EXPECT_TRUE(cookies_->wasSet("TEST_SID"));
    EXPECT_TRUE(cookies_->wasSet("TEST_INTEGRITY"));
    EXPECT_TRUE(cookies_->wasDeleted("TEST_CSRF"));
    EXPECT_FALSE(cookies_->wasSet("TEST_PL"));
    EXPECT_TRUE(accounts_->findById(account.id)->timeLastLogin.has_value());

    newRequest();
    auto current = auth_->currentAccount();
    ASSERT_TRUE(current.has_value());
    EXPECT_EQ(current->id, account.id);
}

TEST_F(AuthServiceTest, Login_KeepLoggedIn_IssuesPersistentLogin) {
    addAccount();

    ASSERT_TRUE(auth_->login(EMAIL, PASSWORD, true).success());

    EXPECT_TRUE(cookies_->wasSet("TEST_PL"));
    EXPECT_EQ(logins_->size(), 1u);
}

TEST_F(AuthServiceTest, Login_WrongPasswordAndUnknownEmail_SameAnswer) {
    addAccount();

    auto wrongPassword = auth_->login(EMAIL, "wrong-password", false);
    auto unknownEmail = auth_->login("nobody@example.com", PASSWORD, false);

    EXPECT_EQ(wrongPassword.status, AuthStatus::InvalidCredentials);
    EXPECT_EQ(unknownEmail.status, AuthStatus::InvalidCredentials);
    EXPECT_EQ(wrongPassword.message, "Incorrect email address or password.");
    EXPECT_EQ(wrongPassword.message, unknownEmail.message);
    EXPECT_EQ(sessions_->size(), 0u);
}

TEST_F(AuthServiceTest, Login_InvalidInput) {
    EXPECT_EQ(auth_->login("not-an-email", PASSWORD, false).status, AuthStatus::InvalidInput);
    EXPECT_EQ(auth_->login(EMAIL, "short", false).status, AuthStatus::InvalidInput);
}

TEST_F(AuthServiceTest, Login_AlreadyLoggedIn) {
    addAccount();
    ASSERT_TRUE(auth_->login(EMAIL, PASSWORD, false).success());

    newRequest();
    auto result = auth_->login(EMAIL, PASSWORD, false);
    EXPECT_EQ(result.status, AuthStatus::AlreadyLoggedIn);
    EXPECT_EQ(result.message, "You are already logged in.");
}

TEST_F(AuthServiceTest, Login_PersistentLoginFailure_RollsBackSession) {
    addAccount();
    logins_->setFailSaves(true);

    auto result = auth_->login(EMAIL, PASSWORD, true);

    EXPECT_EQ(result.status, AuthStatus::Failed);
    EXPECT_EQ(sessions_->size(), 0u);
    EXPECT_TRUE(cookies_->wasDeleted("TEST_SID"));
    EXPECT_TRUE(cookies_->wasDeleted("TEST_INTEGRITY"));
    EXPECT_FALSE(cookies_->wasSet("TEST_PL"));
}

TEST_F(AuthServiceTest, Login_SessionFailure_KeepsEarlierPersistentLogin) {
    auto account = addAccount();
    ASSERT_TRUE(auth_->login(EMAIL, PASSWORD, true).success());

    // Сессия браузера потеряна, cookie "запомнить меня" осталась
    newRequest();
    cookies_->removeIncoming("TEST_SID");
    cookies_->removeIncoming("TEST_INTEGRITY");
    sessions_->setFailSaves(true);

    EXPECT_EQ(auth_->login(EMAIL, PASSWORD, false).status, AuthStatus::Failed);
    EXPECT_EQ(logins_->size(), 1u);
    EXPECT_FALSE(cookies_->wasDeleted("TEST_PL"));

    sessions_->setFailSaves(false);
    newRequest();
    auto current = auth_->currentAccount();
    ASSERT_TRUE(current.has_value());
    EXPECT_EQ(current->id, account.id);
}

TEST_F(AuthServiceTest, Logout_RemovesSessionAndPersistentLogin) {
    addAccount();
    ASSERT_TRUE(auth_->login(EMAIL, PASSWORD, true).success());

    newRequest();
    EXPECT_TRUE(auth_->logout().success());
    EXPECT_EQ(logins_->size(), 0u);
    EXPECT_EQ(sessions_->size(), 0u);
    EXPECT_TRUE(cookies_->wasDeleted("TEST_PL"));
    EXPECT_TRUE(cookies_->wasDeleted("TEST_SID"));

    newRequest();
    EXPECT_FALSE(auth_->currentAccount().has_value());
}

// ============================================
// Восстановление сессии по persistent login
// ============================================

TEST_F(AuthServiceTest, CurrentAccount_Anonymous) {
    EXPECT_FALSE(auth_->currentAccount().has_value());
}

TEST_F(AuthServiceTest, CurrentAccount_RestoresFromPersistentLogin) {
    auto account = addAccount();
    ASSERT_TRUE(auth_->login(EMAIL, PASSWORD, true).success());
    auto firstCookie = *cookies_->outgoing("TEST_PL");

    // Сессия истекла, осталась только cookie "запомнить меня"
    sessions_->clear();
    newRequest();

    auto current = auth_->currentAccount();
    ASSERT_TRUE(current.has_value());
    EXPECT_EQ(current->id, account.id);
    EXPECT_TRUE(cookies_->wasSet("TEST_SID"));
    EXPECT_TRUE(cookies_->wasSet("TEST_INTEGRITY"));

    auto rotated = cookies_->outgoing("TEST_PL");
    ASSERT_TRUE(rotated.has_value());
    EXPECT_NE(*rotated, firstCookie);
    EXPECT_EQ(logins_->size(), 1u);

    newRequest();
    EXPECT_TRUE(auth_->currentAccount().has_value());
}

TEST_F(AuthServiceTest, CurrentAccount_OtherClient_NotRestored) {
    addAccount();
    ASSERT_TRUE(auth_->login(EMAIL, PASSWORD, true).success());

    sessions_->clear();
    request_->setClientAddress("203.0.113.7");
    newRequest();

    EXPECT_FALSE(auth_->currentAccount().has_value());
}

TEST_F(AuthServiceTest, CurrentAccount_DeletedAccount_NotRestored) {
    auto account = addAccount();
    ASSERT_TRUE(auth_->login(EMAIL, PASSWORD, true).success());

    sessions_->clear();
    accounts_->deleteById(account.id);
    newRequest();

    EXPECT_FALSE(auth_->currentAccount().has_value());
}

// ============================================
// Регистрация и активация
// ============================================

TEST_F(AuthServiceTest, Register_ThenActivate_ThenLogin) {
    auto registered = auth_->registerAccount("new@example.com", PASSWORD, "New User");
    EXPECT_EQ(registered.status, AuthStatus::Ok);
    EXPECT_EQ(registered.message, "An account activation link has been sent to your email address.");
    EXPECT_EQ(pending_->size(), 1u);
    EXPECT_TRUE(cookies_->wasDeleted("TEST_CSRF"));

    auto sent = mailer_->sentMessages();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].address, "new@example.com");

    auto code = codeFromLastMail("activate-account");
    ASSERT_EQ(code.size(), 64u);

    newRequest();
    auto activated = auth_->activateAccount(code);
    EXPECT_EQ(activated.status, AuthStatus::Ok);
    EXPECT_EQ(pending_->size(), 0u);

    auto account = accounts_->findByEmail("new@example.com");
    ASSERT_TRUE(account.has_value());
    EXPECT_EQ(account->displayName, "New User");

    newRequest();
    EXPECT_TRUE(auth_->login("new@example.com", PASSWORD, false).success());
}

TEST_F(AuthServiceTest, Register_Duplicates) {
    addAccount();
    EXPECT_EQ(auth_->registerAccount(EMAIL, PASSWORD, "User").status, AuthStatus::Conflict);

    ASSERT_TRUE(auth_->registerAccount("new@example.com", PASSWORD, "New").success());
    auto again = auth_->registerAccount("new@example.com", PASSWORD, "New");
    EXPECT_EQ(again.status, AuthStatus::Conflict);
    EXPECT_EQ(again.message, "This account is already awaiting activation.");
}

TEST_F(AuthServiceTest, Register_InvalidInput) {
    EXPECT_EQ(auth_->registerAccount("bad", PASSWORD, "User").status, AuthStatus::InvalidInput);

    auto shortPassword = auth_->registerAccount("new@example.com", "short", "User");
    EXPECT_EQ(shortPassword.status, AuthStatus::InvalidInput);
    EXPECT_EQ(shortPassword.message, "Password must be between 8 and 72 characters.");

    EXPECT_EQ(auth_->registerAccount("new@example.com", PASSWORD, " leading").status,
              AuthStatus::InvalidInput);
    EXPECT_EQ(pending_->size(), 0u);
}

TEST_F(AuthServiceTest, Register_MailFailure_RemovesPendingAccount) {
    mailer_->setFailing(true);

    auto result = auth_->registerAccount("new@example.com", PASSWORD, "New");

    EXPECT_EQ(result.status, AuthStatus::Failed);
    EXPECT_EQ(pending_->size(), 0u);
    EXPECT_FALSE(cookies_->wasDeleted("TEST_CSRF"));
}

TEST_F(AuthServiceTest, Activate_UnknownOrMalformedCode) {
    EXPECT_EQ(auth_->activateAccount(std::string(64, 'a')).status, AuthStatus::NotFound);
    EXPECT_EQ(auth_->activateAccount("xyz").status, AuthStatus::InvalidInput);
}

// ============================================
// Сброс пароля
// ============================================

TEST_F(AuthServiceTest, PasswordReset_FullFlow) {
    auto account = addAccount();

    auto requested = auth_->sendPasswordReset(EMAIL);
    EXPECT_EQ(requested.status, AuthStatus::Ok);
    ASSERT_EQ(resets_->size(), 1u);
    auto code = codeFromLastMail("reset-password");
    ASSERT_EQ(code.size(), 64u);

    newRequest();
    EXPECT_EQ(auth_->resetPassword(code, "brand-new-pass").status, AuthStatus::Ok);
    EXPECT_EQ(resets_->size(), 0u);
    EXPECT_TRUE(security_->verifyPassword("brand-new-pass", accounts_->findById(account.id)->passwordHash));

    newRequest();
    auto reused = auth_->resetPassword(code, "another-pass");
    EXPECT_EQ(reused.status, AuthStatus::InvalidInput);
    EXPECT_EQ(reused.message, "This password reset request is no longer valid.");
}

TEST_F(AuthServiceTest, PasswordReset_UnknownEmail_SameAnswer) {
    addAccount();

    auto known = auth_->sendPasswordReset(EMAIL);
    auto unknown = auth_->sendPasswordReset("nobody@example.com");

    EXPECT_EQ(known.status, unknown.status);
    EXPECT_EQ(known.message, unknown.message);
    EXPECT_EQ(mailer_->sentMessages().size(), 1u);
}

TEST_F(AuthServiceTest, PasswordReset_RepeatedRequest_ReplacesCode) {
    addAccount();

    ASSERT_TRUE(auth_->sendPasswordReset(EMAIL).success());
    auto first = codeFromLastMail("reset-password");
    ASSERT_TRUE(auth_->sendPasswordReset(EMAIL).success());
    auto second = codeFromLastMail("reset-password");

    EXPECT_EQ(resets_->size(), 1u);
    EXPECT_NE(first, second);
    EXPECT_EQ(auth_->resetPassword(first, "brand-new-pass").status, AuthStatus::InvalidInput);
}

TEST_F(AuthServiceTest, PasswordReset_MailFailure) {
    addAccount();
    mailer_->setFailing(true);

    EXPECT_EQ(auth_->sendPasswordReset(EMAIL).status, AuthStatus::Failed);
    EXPECT_EQ(resets_->size(), 0u);
}

// ============================================
// Изменение аккаунта
// ============================================

TEST_F(AuthServiceTest, ChangePassword) {
    auto account = addAccount();
    EXPECT_EQ(auth_->changePassword(PASSWORD, "brand-new-pass").status, AuthStatus::NotLoggedIn);

    ASSERT_TRUE(auth_->login(EMAIL, PASSWORD, false).success());
    newRequest();

    EXPECT_EQ(auth_->changePassword("wrong-password", "brand-new-pass").status, AuthStatus::Forbidden);
    EXPECT_EQ(auth_->changePassword(PASSWORD, "brand-new-pass").status, AuthStatus::Ok);
    EXPECT_TRUE(security_->verifyPassword("brand-new-pass", accounts_->findById(account.id)->passwordHash));
}

TEST_F(AuthServiceTest, ChangeDisplayName) {
    auto account = addAccount();
    ASSERT_TRUE(auth_->login(EMAIL, PASSWORD, false).success());
    newRequest();

    EXPECT_EQ(auth_->changeDisplayName("").status, AuthStatus::InvalidInput);
    EXPECT_EQ(auth_->changeDisplayName("O'Neil Jr.").status, AuthStatus::Ok);
    EXPECT_EQ(accounts_->findById(account.id)->displayName, "O'Neil Jr.");
}

TEST_F(AuthServiceTest, DeleteAccount_RunsHooks) {
    auto account = addAccount();
    roles_->assign(account.id, domain::Role::Editor);
    ASSERT_TRUE(auth_->sendPasswordReset(EMAIL).success());
    ASSERT_TRUE(auth_->login(EMAIL, PASSWORD, true).success());
    newRequest();

    auto result = auth_->deleteAccount();

    EXPECT_EQ(result.status, AuthStatus::Ok);
    EXPECT_EQ(accounts_->size(), 0u);
    EXPECT_EQ(roles_->size(), 0u);
    EXPECT_EQ(logins_->size(), 0u);
    EXPECT_EQ(resets_->size(), 0u);
    EXPECT_EQ(sessions_->size(), 0u);
    EXPECT_TRUE(cookies_->wasDeleted("TEST_PL"));
}

TEST_F(AuthServiceTest, DeleteAccount_HookFailure_KeepsAccount) {
    auto account = addAccount();
    roles_->assign(account.id, domain::Role::Editor);
    ASSERT_TRUE(auth_->login(EMAIL, PASSWORD, false).success());
    newRequest();
    roles_->setFailDeletes(true);

    EXPECT_EQ(auth_->deleteAccount().status, AuthStatus::Failed);
    EXPECT_EQ(accounts_->size(), 1u);
}

TEST_F(AuthServiceTest, DeleteAccount_NotLoggedIn) {
    addAccount();
    EXPECT_EQ(auth_->deleteAccount().status, AuthStatus::NotLoggedIn);
    EXPECT_EQ(accounts_->size(), 1u);
}

TEST_F(AuthServiceTest, IssueCsrfToken) {
    auto token = auth_->issueCsrfToken();

    EXPECT_EQ(token.size(), 64u);
    auto cookie = cookies_->outgoing("TEST_CSRF");
    ASSERT_TRUE(cookie.has_value());
    EXPECT_TRUE(security_->verifyCsrfToken(domain::CsrfToken(token, *cookie)));
}
