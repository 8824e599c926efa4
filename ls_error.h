#ifndef LS_ERROR_H
#define LS_ERROR_H

#include <stdexcept>
#include <string>

/**
 * @brief Erro base de uma operação de listagem
 *
 * Toda falha que aborta a listagem deriva desta classe. O caminho envolvido
 * fica disponível em path() e a mensagem (what()) já vem pronta para o usuário.
 */
class LsError : public std::runtime_error
{
public:
    enum class Kind
    {
        InvalidPath,  // argumento não é arquivo nem diretório
        ReadFault,    // erro de E/S (listar diretório, stat, abrir)
        TagReadFault  // arquivo nomeado explicitamente sem tag legível
    };

    LsError(Kind kind, const std::string &path, const std::string &message)
        : std::runtime_error(message), kind_(kind), path_(path)
    {
    }

    Kind kind() const { return kind_; }
    const std::string &path() const { return path_; }

private:
    Kind kind_;
    std::string path_;
};

class InvalidPathError : public LsError
{
public:
    explicit InvalidPathError(const std::string &path)
        : LsError(Kind::InvalidPath, path,
                  "não foi possível acessar \"" + path + "\": arquivo ou diretório inexistente")
    {
    }
};

class ReadError : public LsError
{
public:
    ReadError(const std::string &path, const std::string &reason)
        : LsError(Kind::ReadFault, path, "erro ao ler \"" + path + "\": " + reason)
    {
    }
};

class TagReadError : public LsError
{
public:
    TagReadError(const std::string &path, const std::string &reason)
        : LsError(Kind::TagReadFault, path, "erro ao ler as tags de \"" + path + "\": " + reason)
    {
    }
};

#endif // LS_ERROR_H
