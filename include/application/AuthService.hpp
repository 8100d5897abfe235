#pragma once

#include "ports/input/IAuthService.hpp"
#include "ports/input/IAccountService.hpp"
#include "ports/input/IPersistentLoginManager.hpp"
#include "ports/output/IAccountRepository.hpp"
#include "ports/output/IPendingAccountRepository.hpp"
#include "ports/output/IPasswordResetRepository.hpp"
#include "ports/output/ICookieService.hpp"
#include "ports/output/ISecurityService.hpp"
#include "application/InputValidator.hpp"
#include "application/TransactionalEmailSender.hpp"
#include "application/hooks/IAccountDeletionHook.hpp"
#include <memory>
#include <vector>
#include <chrono>
#include <iostream>
#include <stdexcept>

namespace webauth::application {

/**
 * @brief Сценарии аутентификации и управления аккаунтом
 *
 * Создаётся на каждый запрос. Cookie пишутся в ICookieService и уходят
 * клиенту только вместе с ответом, поэтому при ошибке посреди сценария
 * ставится компенсирующее удаление.
 */
class AuthService : public ports::input::IAuthService {
public:
    AuthService(
        std::shared_ptr<ports::input::IAccountService> accountService,
        std::shared_ptr<ports::input::IPersistentLoginManager> persistentLoginManager,
        std::shared_ptr<ports::output::ISecurityService> security,
        std::shared_ptr<ports::output::ICookieService> cookies,
        std::shared_ptr<ports::output::IAccountRepository> accountRepo,
        std::shared_ptr<ports::output::IPendingAccountRepository> pendingRepo,
        std::shared_ptr<ports::output::IPasswordResetRepository> resetRepo,
        std::shared_ptr<TransactionalEmailSender> emailSender,
        std::vector<std::shared_ptr<hooks::IAccountDeletionHook>> deletionHooks = {}
    ) : accountService_(std::move(accountService))
      , persistentLoginManager_(std::move(persistentLoginManager))
      , security_(std::move(security))
      , cookies_(std::move(cookies))
      , accountRepo_(std::move(accountRepo))
      , pendingRepo_(std::move(pendingRepo))
      , resetRepo_(std::move(resetRepo))
      , emailSender_(std::move(emailSender))
      , deletionHooks_(std::move(deletionHooks))
    {}

    ports::input::AuthResult login(
        const std::string& email,
        const std::string& password,
        bool keepLoggedIn
    ) override {
        if (accountService_->loggedInAccount()) {
            return {ports::input::AuthStatus::AlreadyLoggedIn, "You are already logged in."};
        }
        if (!InputValidator::isEmail(email) || !InputValidator::isPassword(password)) {
            return {ports::input::AuthStatus::InvalidInput, "Email or password is invalid."};
        }

        auto account = accountRepo_->findByEmail(email);
        if (!account || !security_->verifyPassword(password, account->passwordHash)) {
            return {ports::input::AuthStatus::InvalidCredentials, "Incorrect email address or password."};
        }

        account->timeLastLogin = std::chrono::system_clock::now();
        try {
            if (!accountRepo_->save(*account)) {
                throw std::runtime_error("Failed to save account.");
            }
            if (!accountService_->establishSessionIntegrity(*account)) {
                throw std::runtime_error("Failed to establish session integrity.");
            }
            if (keepLoggedIn) {
                persistentLoginManager_->create(account->id);
            }
            cookies_->deleteCsrfCookie();
        } catch (const std::exception& e) {
            std::cerr << "[AuthService] login() failed: " << e.what() << std::endl;
            rollbackLogin();
            return {ports::input::AuthStatus::Failed, "Login failed."};
        }

        std::cout << "[AuthService] Account " << account->id << " logged in" << std::endl;
        return {ports::input::AuthStatus::Ok, "Login successful."};
    }

    ports::input::AuthResult logout() override {
        persistentLoginManager_->remove();
        accountService_->deleteSession();
        return {ports::input::AuthStatus::Ok, "Logged out."};
    }

    std::optional<domain::Account> currentAccount() override {
        if (auto account = accountService_->loggedInAccount()) {
            return account;
        }

        auto accountId = persistentLoginManager_->resolve();
        if (!accountId) {
            return std::nullopt;
        }

        auto account = accountRepo_->findById(*accountId);
        if (!account) {
            return std::nullopt;
        }
        if (!accountService_->establishSessionIntegrity(*account)) {
            return std::nullopt;
        }
        persistentLoginManager_->rotate(account->id);

        std::cout << "[AuthService] Session restored for account " << account->id << std::endl;
        return account;
    }

    ports::input::AuthResult registerAccount(
        const std::string& email,
        const std::string& password,
        const std::string& displayName
    ) override {
        if (!InputValidator::isEmail(email)) {
            return {ports::input::AuthStatus::InvalidInput, "Email address is invalid."};
        }
        if (!InputValidator::isPassword(password)) {
            return {ports::input::AuthStatus::InvalidInput, passwordLengthMessage()};
        }
        if (!InputValidator::isDisplayName(displayName)) {
            return {ports::input::AuthStatus::InvalidInput, displayNameMessage()};
        }
        if (accountRepo_->existsByEmail(email)) {
            return {ports::input::AuthStatus::Conflict, "This account is already registered."};
        }
        if (pendingRepo_->existsByEmail(email)) {
            return {ports::input::AuthStatus::Conflict, "This account is already awaiting activation."};
        }

        domain::PendingAccount pendingAccount;
        pendingAccount.email = email;
        pendingAccount.passwordHash = security_->hashPassword(password);
        pendingAccount.displayName = displayName;
        pendingAccount.activationCode = security_->generateToken();
        pendingAccount.timeRegistered = std::chrono::system_clock::now();

        if (!pendingRepo_->save(pendingAccount)) {
            return {ports::input::AuthStatus::Failed, "Account registration failed."};
        }
        if (!emailSender_->sendActivation(email, displayName, pendingAccount.activationCode)) {
            std::cerr << "[AuthService] Activation email not sent, removing pending account" << std::endl;
            if (!pendingRepo_->deleteById(pendingAccount.id)) {
                std::cerr << "[AuthService] Failed to remove pending account " << pendingAccount.id << std::endl;
            }
            return {ports::input::AuthStatus::Failed, "Account registration failed."};
        }

        cookies_->deleteCsrfCookie();
        return {ports::input::AuthStatus::Ok,
                "An account activation link has been sent to your email address."};
    }

    ports::input::AuthResult activateAccount(const std::string& activationCode) override {
        if (!InputValidator::isToken(activationCode)) {
            return {ports::input::AuthStatus::InvalidInput, "Activation code format is invalid."};
        }

        auto pendingAccount = pendingRepo_->findByActivationCode(activationCode);
        if (!pendingAccount) {
            return {ports::input::AuthStatus::NotFound,
                    "No account is awaiting activation for the given code."};
        }
        if (accountRepo_->existsByEmail(pendingAccount->email)) {
            return {ports::input::AuthStatus::Conflict, "This email address is already registered."};
        }

        domain::Account account(
            pendingAccount->email,
            pendingAccount->passwordHash,
            pendingAccount->displayName
        );
        if (!accountRepo_->save(account)) {
            return {ports::input::AuthStatus::Failed, "Account activation failed."};
        }
        if (!pendingRepo_->deleteById(pendingAccount->id)) {
            if (!accountRepo_->deleteById(account.id)) {
                std::cerr << "[AuthService] Failed to remove account " << account.id << std::endl;
            }
            return {ports::input::AuthStatus::Failed, "Account activation failed."};
        }

        cookies_->deleteCsrfCookie();
        std::cout << "[AuthService] Account " << account.id << " activated" << std::endl;
        return {ports::input::AuthStatus::Ok, "Your account has been activated."};
    }

    ports::input::AuthResult sendPasswordReset(const std::string& email) override {
        if (!InputValidator::isEmail(email)) {
            return {ports::input::AuthStatus::InvalidInput, "Email address is invalid."};
        }

        if (auto account = accountRepo_->findByEmail(email)) {
            auto existing = resetRepo_->findByAccountId(account->id);
            domain::PasswordReset passwordReset;
            if (existing) {
                passwordReset = *existing;
            } else {
                passwordReset.accountId = account->id;
            }
            passwordReset.resetCode = security_->generateToken();
            passwordReset.timeRequested = std::chrono::system_clock::now();

            if (!resetRepo_->save(passwordReset)) {
                return {ports::input::AuthStatus::Failed,
                        "We couldn't send the email. Please try again later."};
            }
            if (!emailSender_->sendPasswordReset(account->email, account->displayName, passwordReset.resetCode)) {
                if (!existing && !resetRepo_->deleteById(passwordReset.id)) {
                    std::cerr << "[AuthService] Failed to remove password reset " << passwordReset.id << std::endl;
                }
                return {ports::input::AuthStatus::Failed,
                        "We couldn't send the email. Please try again later."};
            }
        }

        cookies_->deleteCsrfCookie();
        return {ports::input::AuthStatus::Ok,
                "A password reset link has been sent to your email address."};
    }

    ports::input::AuthResult resetPassword(
        const std::string& resetCode,
        const std::string& newPassword
    ) override {
        if (!InputValidator::isToken(resetCode)) {
            return {ports::input::AuthStatus::InvalidInput, "Reset code format is invalid."};
        }
        if (!InputValidator::isPassword(newPassword)) {
            return {ports::input::AuthStatus::InvalidInput, passwordLengthMessage()};
        }

        auto passwordReset = resetRepo_->findByResetCode(resetCode);
        std::optional<domain::Account> account;
        if (passwordReset) {
            account = accountRepo_->findById(passwordReset->accountId);
        }
        if (!account) {
            return {ports::input::AuthStatus::InvalidInput,
                    "This password reset request is no longer valid."};
        }

        account->passwordHash = security_->hashPassword(newPassword);
        if (!accountRepo_->save(*account) || !resetRepo_->deleteById(passwordReset->id)) {
            return {ports::input::AuthStatus::Failed, "Password reset failed."};
        }

        cookies_->deleteCsrfCookie();
        return {ports::input::AuthStatus::Ok, "Your password has been reset."};
    }

    ports::input::AuthResult changePassword(
        const std::string& currentPassword,
        const std::string& newPassword
    ) override {
        if (!InputValidator::isPassword(currentPassword) || !InputValidator::isPassword(newPassword)) {
            return {ports::input::AuthStatus::InvalidInput, passwordLengthMessage()};
        }

        auto account = accountService_->loggedInAccount();
        if (!account) {
            return notLoggedIn();
        }
        if (!security_->verifyPassword(currentPassword, account->passwordHash)) {
            return {ports::input::AuthStatus::Forbidden, "Current password is incorrect."};
        }

        account->passwordHash = security_->hashPassword(newPassword);
        if (!accountRepo_->save(*account)) {
            return {ports::input::AuthStatus::Failed, "Password change failed."};
        }
        return {ports::input::AuthStatus::Ok, "Password changed."};
    }

    ports::input::AuthResult changeDisplayName(const std::string& displayName) override {
        if (!InputValidator::isDisplayName(displayName)) {
            return {ports::input::AuthStatus::InvalidInput, displayNameMessage()};
        }

        auto account = accountService_->loggedInAccount();
        if (!account) {
            return notLoggedIn();
        }

        account->displayName = displayName;
        if (!accountRepo_->save(*account)) {
            return {ports::input::AuthStatus::Failed, "Display name change failed."};
        }
        return {ports::input::AuthStatus::Ok, "Display name changed."};
    }

    ports::input::AuthResult deleteAccount() override {
        auto account = accountService_->loggedInAccount();
        if (!account) {
            return notLoggedIn();
        }

        try {
            for (auto& hook : deletionHooks_) {
                hook->onDeleteAccount(*account);
            }
            if (!accountRepo_->deleteById(account->id)) {
                throw std::runtime_error("Failed to delete account.");
            }
        } catch (const std::exception& e) {
            std::cerr << "[AuthService] deleteAccount() failed: " << e.what() << std::endl;
            return {ports::input::AuthStatus::Failed, "Failed to delete account."};
        }

        persistentLoginManager_->remove();
        accountService_->deleteSession();

        std::cout << "[AuthService] Account " << account->id << " deleted" << std::endl;
        return {ports::input::AuthStatus::Ok, "Account deleted."};
    }

    std::string issueCsrfToken() override {
        auto csrfToken = security_->generateCsrfToken();
        cookies_->setCookie(cookies_->csrfCookieName(), csrfToken.cookieValue, std::nullopt);
        return csrfToken.token;
    }

private:
    std::shared_ptr<ports::input::IAccountService> accountService_;
    std::shared_ptr<ports::input::IPersistentLoginManager> persistentLoginManager_;
    std::shared_ptr<ports::output::ISecurityService> security_;
    std::shared_ptr<ports::output::ICookieService> cookies_;
    std::shared_ptr<ports::output::IAccountRepository> accountRepo_;
    std::shared_ptr<ports::output::IPendingAccountRepository> pendingRepo_;
    std::shared_ptr<ports::output::IPasswordResetRepository> resetRepo_;
    std::shared_ptr<TransactionalEmailSender> emailSender_;
    std::vector<std::shared_ptr<hooks::IAccountDeletionHook>> deletionHooks_;

    // persistentLoginManager_->create() идёт последним и при ошибке ничего не оставляет,
    // а запись по входящей cookie принадлежит прежнему входу с этого устройства
    void rollbackLogin() {
        try {
            accountService_->deleteSession();
        } catch (const std::exception& e) {
            std::cerr << "[AuthService] Session cleanup failed: " << e.what() << std::endl;
        }
    }

    static ports::input::AuthResult notLoggedIn() {
        return {ports::input::AuthStatus::NotLoggedIn,
                "You do not have permission to perform this action."};
    }

    static std::string passwordLengthMessage() {
        return "Password must be between "
            + std::to_string(ports::output::ISecurityService::PASSWORD_MIN_LENGTH) + " and "
            + std::to_string(ports::output::ISecurityService::PASSWORD_MAX_LENGTH) + " characters.";
    }

    static std::string displayNameMessage() {
        return "Display name is invalid. It must start with a letter or number and may only"
               " contain letters, numbers, spaces, dots, hyphens, and apostrophes.";
    }
};

} // namespace webauth::application
